#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/backup/Backup.hpp"
#include "core/errors/Errors.hpp"
#include "support/FakeBackends.hpp"

using namespace filemeta;
using filemeta::test::FakeWorld;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char* const kFile = "/photos/beach.jpg";

class BackupTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("filemeta_backup_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
            "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string file(const std::string& name) const { return (dir_ / name).string(); }

  static void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
  }

  static std::vector<std::string> lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
  }

  FakeWorld world;
  MetadataObject md{kFile, world.collaborators()};

private:
  fs::path dir_;
};

} // namespace

TEST_F(BackupTest, SnapshotWipeRestore) {
  md.set("keywords", Value::ofStringList({"sun", "sand"}));
  md.set("starrating", Value::ofInteger(5));
  md.set("duedate", Value::ofDateTime(parseIsoDateTime("2024-07-01T09:30:00")));
  md.setTags({{"Holiday", 0}, {"Orange", 0}});
  md.set("findercomment", Value::ofString("best day"));
  world.items->put(kFile, "kMDItemContentType", json("public.jpeg"));

  BackupRecord before = snapshot(md);
  EXPECT_EQ(before.fileName, "beach.jpg");
  EXPECT_EQ(before.filePath, kFile);
  EXPECT_TRUE(before.values.contains("contenttype"));

  md.wipe();
  EXPECT_TRUE(md.tags().empty());
  EXPECT_TRUE(md.get("keywords").isEmpty());

  RestoreReport report = restore(md, before);
  EXPECT_TRUE(report.failed.empty());
  EXPECT_EQ(std::count(report.restored.begin(), report.restored.end(), "contenttype"), 0);
  EXPECT_EQ(snapshot(md).toJson(), before.toJson());
  EXPECT_EQ(md.tags(), (std::vector<Tag>{{"Holiday", 0}, {"Orange", 7}}));
}

TEST_F(BackupTest, RestoreReportsBadEntriesAndContinues) {
  BackupRecord r;
  r.fileName = "beach.jpg";
  r.values = {{"flavor", "salty"}, {"starrating", "five"}, {"headline", "Waves"}};

  RestoreReport report = restore(md, r);
  EXPECT_EQ(report.restored, (std::vector<std::string>{"headline"}));
  ASSERT_EQ(report.failed.size(), 2u);
  EXPECT_EQ(report.failed[0].first, "flavor");
  EXPECT_EQ(report.failed[1].first, "starrating");
  EXPECT_EQ(md.get("headline").asString(), "Waves");
}

TEST_F(BackupTest, AllModeCarriesUnregisteredXattrs) {
  md.set("headline", Value::ofString("Waves"));
  world.xattr->write(kFile, "org.example.origin", Bytes{'c', 'a', 'm', 0x00, 0xFF});

  EXPECT_FALSE(snapshot(md).values.contains("org.example.origin"));

  BackupRecord before = snapshot(md, true);
  EXPECT_EQ(before.values["org.example.origin"], "Y2FtAP8=");
  EXPECT_EQ(before.values["headline"], "Waves");

  world.xattr->remove(kFile, "org.example.origin");
  md.wipe();

  RestoreReport report = restore(md, before, AttributeRegistry::instance(), true);
  EXPECT_TRUE(report.failed.empty());
  EXPECT_EQ(report.restored, (std::vector<std::string>{"org.example.origin", "headline"}));
  EXPECT_EQ(world.xattr->read(kFile, "org.example.origin").value_or(Bytes()),
            (Bytes{'c', 'a', 'm', 0x00, 0xFF}));
  EXPECT_EQ(snapshot(md, true).toJson(), before.toJson());
}

TEST_F(BackupTest, AllModeRestoreReportsBadRawEntries) {
  BackupRecord r;
  r.fileName = "beach.jpg";
  r.values = {{"org.example.a", "not*base64"},
              {"org.example.b", 42},
              {"org.example.c", ""},
              {"com.apple.FinderInfo", "AAAA"}};

  RestoreReport report = restore(md, r, AttributeRegistry::instance(), true);
  EXPECT_EQ(report.restored, (std::vector<std::string>{"org.example.c"}));
  ASSERT_EQ(report.failed.size(), 3u);
  EXPECT_EQ(report.failed[0].first, "com.apple.FinderInfo");
  EXPECT_EQ(report.failed[1].first, "org.example.a");
  EXPECT_EQ(report.failed[2].first, "org.example.b");
  EXPECT_TRUE(world.xattr->has(kFile, "org.example.c"));
  EXPECT_FALSE(world.xattr->has(kFile, "org.example.a"));
  EXPECT_FALSE(world.xattr->has(kFile, kFinderInfoKey));

  // without all mode the same keys are unknown attributes
  RestoreReport plain = restore(md, r);
  EXPECT_TRUE(plain.restored.empty());
  EXPECT_EQ(plain.failed.size(), 4u);
}

TEST_F(BackupTest, RecordRequiresFilename) {
  EXPECT_THROW(BackupRecord::fromJson(json{{"headline", "x"}}), TypeMismatch);
  BackupRecord r = BackupRecord::fromJson(
      json{{"_filename", "a"}, {"_version", "0.1"}, {"_extra", 1}, {"headline", "x"}});
  EXPECT_EQ(r.version, "0.1");
  EXPECT_EQ(r.values, (json{{"headline", "x"}}));
}

TEST_F(BackupTest, FileKeepsOneLinePerRecordAndNeverPrunes) {
  const std::string path = file("backup.json");
  {
    BackupFile bf(path);
    bf.load();
    EXPECT_TRUE(bf.records().empty());

    BackupRecord a;
    a.fileName = "a.txt";
    a.values = {{"headline", "first"}};
    BackupRecord b;
    b.fileName = "b.txt";
    bf.put(a);
    bf.put(b);
    a.values = {{"headline", "second"}};
    bf.put(a);
    bf.save();
  }
  auto written = lines(path);
  ASSERT_EQ(written.size(), 2u);
  EXPECT_EQ(json::parse(written[0])["headline"], "second");

  BackupFile again(path);
  again.load();
  ASSERT_EQ(again.records().size(), 2u);
  ASSERT_NE(again.find("b.txt"), nullptr);
  EXPECT_EQ(again.find("missing.txt"), nullptr);
}

TEST_F(BackupTest, LoadsArrayFormAndLaterDuplicatesWin) {
  const std::string path = file("old.json");
  writeText(path,
            R"([{"_filename": "x", "headline": "one"},)"
            R"( {"_filename": "y"},)"
            R"( {"_filename": "x", "headline": "two"}])");
  BackupFile bf(path);
  bf.load();
  ASSERT_EQ(bf.records().size(), 2u);
  EXPECT_EQ(bf.find("x")->values["headline"], "two");
}

TEST_F(BackupTest, MalformedFileIsStorageError) {
  const std::string path = file("broken.json");
  writeText(path, "{\"_filename\": \"x\"\n");
  BackupFile bf(path);
  EXPECT_THROW(bf.load(), StorageError);

  writeText(path, "not json at all");
  EXPECT_THROW(bf.load(), StorageError);
}
