#include <gtest/gtest.h>

#include <filesystem>

#include <sqlite3.h>

#include "core/errors/Errors.hpp"
#include "core/index/InitDb.hpp"
#include "core/index/SidecarIndex.hpp"
#include "core/metadata/MetadataObject.hpp"
#include "support/FakeBackends.hpp"

using namespace filemeta;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

class SidecarIndexTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           (std::string("filemeta_index_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    dbPath_ = (dir_ / "index.db").string();
    ASSERT_EQ(initDatabase(dbPath_, FILEMETA_TEST_SCHEMA), kIndexSchemaVersion);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  std::string dbPath_;
};

} // namespace

TEST_F(SidecarIndexTest, InitIsIdempotent) {
  EXPECT_EQ(initDatabase(dbPath_, FILEMETA_TEST_SCHEMA), kIndexSchemaVersion);
}

TEST_F(SidecarIndexTest, MissingSchemaFails) {
  EXPECT_THROW(initDatabase(dbPath_, (dir_ / "nope.sql").string()), StorageError);
}

TEST_F(SidecarIndexTest, NewerLayoutIsRefused) {
  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(dbPath_.c_str(), &db), SQLITE_OK);
  const std::string bump = "PRAGMA user_version=" + std::to_string(kIndexSchemaVersion + 1) + ";";
  EXPECT_EQ(sqlite3_exec(db, bump.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
  sqlite3_close(db);

  EXPECT_THROW(initDatabase(dbPath_, FILEMETA_TEST_SCHEMA), StorageError);
}

TEST_F(SidecarIndexTest, ResourceValuesUpsertAndRemove) {
  SidecarIndex idx(dbPath_);
  EXPECT_FALSE(idx.getResourceValue("/f", "NSURLTagNamesKey"));

  idx.setResourceValue("/f", "NSURLTagNamesKey", json::array({"a"}));
  idx.setResourceValue("/f", "NSURLTagNamesKey", json::array({"a", "b"}));
  EXPECT_EQ(idx.getResourceValue("/f", "NSURLTagNamesKey").value_or(json()),
            json::array({"a", "b"}));
  EXPECT_FALSE(idx.getResourceValue("/g", "NSURLTagNamesKey"));

  idx.setResourceValue("/f", "NSURLTagNamesKey", nullptr);
  EXPECT_FALSE(idx.getResourceValue("/f", "NSURLTagNamesKey"));
}

TEST_F(SidecarIndexTest, ItemValuesAreSeparateFromResources) {
  SidecarIndex idx(dbPath_);
  idx.putItemValue("/f", "kMDItemDisplayName", json("F"));
  EXPECT_EQ(idx.copyItemValue("/f", "kMDItemDisplayName").value_or(json()), json("F"));
  EXPECT_FALSE(idx.getResourceValue("/f", "kMDItemDisplayName"));
}

TEST_F(SidecarIndexTest, ValuesSurviveReopen) {
  {
    SidecarIndex idx(dbPath_);
    idx.setResourceValue("/f", "NSURLIsHiddenKey", true);
  }
  SidecarIndex again(dbPath_);
  EXPECT_EQ(again.getResourceValue("/f", "NSURLIsHiddenKey").value_or(json()), json(true));
}

TEST_F(SidecarIndexTest, OpeningMissingDatabaseFails) {
  EXPECT_THROW(SidecarIndex((dir_ / "missing" / "x.db").string()), StorageError);
}

TEST_F(SidecarIndexTest, BacksTagsAndHiddenForMetadataObject) {
  auto idx = std::make_shared<SidecarIndex>(dbPath_);
  test::FakeWorld world;
  Collaborators c = world.collaborators();
  c.items = idx;
  c.resources = idx;

  MetadataObject md("/f", c);
  md.setTags({{"Red", 0}});
  md.set("hidden", Value::ofBoolean(true));
  EXPECT_EQ(idx->getResourceValue("/f", kTagNamesResourceKey).value_or(json()),
            json::array({"Red"}));
  EXPECT_TRUE(md.get("hidden").asBoolean());

  idx->putItemValue("/f", "kMDItemDisplayName", json("f"));
  EXPECT_EQ(md.get("displayname").asString(), "f");
}
