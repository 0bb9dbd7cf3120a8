#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sys/xattr.h>

#include "core/errors/Errors.hpp"
#include "core/finderinfo/FinderInfoCodec.hpp"
#include "core/metadata/MetadataObject.hpp"
#include "core/storage/LinuxXattr.hpp"

using namespace filemeta;
namespace fs = std::filesystem;

namespace {

// Skips when the temp filesystem has no user xattr support (tmpfs on older
// kernels, some containers).
class LinuxXattrTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = (fs::temp_directory_path() /
             (std::string("filemeta_xattr_") +
              ::testing::UnitTest::GetInstance()->current_test_info()->name()))
                .string();
    {
      std::ofstream out(path_);
      out << "x";
    }
    if (::setxattr(path_.c_str(), "user.filemeta.probe", "1", 1, 0) != 0) {
      int err = errno;
      fs::remove(path_);
      GTEST_SKIP() << "user xattrs unavailable: " << std::strerror(err);
    }
    ::removexattr(path_.c_str(), "user.filemeta.probe");
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  std::string path_;
  LinuxXattr xattr_;
};

} // namespace

TEST_F(LinuxXattrTest, ReadWriteRemove) {
  EXPECT_FALSE(xattr_.read(path_, "com.apple.metadata:kMDItemKeywords"));
  Bytes payload{1, 2, 3, 0, 4};
  xattr_.write(path_, "com.apple.metadata:kMDItemKeywords", payload);
  EXPECT_EQ(xattr_.read(path_, "com.apple.metadata:kMDItemKeywords").value_or(Bytes{}), payload);

  auto keys = xattr_.list(path_);
  EXPECT_NE(std::find(keys.begin(), keys.end(), "com.apple.metadata:kMDItemKeywords"), keys.end());

  xattr_.remove(path_, "com.apple.metadata:kMDItemKeywords");
  xattr_.remove(path_, "com.apple.metadata:kMDItemKeywords");
  EXPECT_FALSE(xattr_.read(path_, "com.apple.metadata:kMDItemKeywords"));
}

TEST_F(LinuxXattrTest, KeysAreNamespaced) {
  xattr_.write(path_, "k", Bytes{7});
  char buf[4];
  EXPECT_EQ(::getxattr(path_.c_str(), "user.k", buf, sizeof(buf)), 1);
}

TEST_F(LinuxXattrTest, MissingFileIsStorageError) {
  EXPECT_THROW(xattr_.read(path_ + ".missing", "k"), StorageError);
}

TEST_F(LinuxXattrTest, StationeryOnRealFile) {
  Collaborators c;
  c.xattr = std::make_shared<LinuxXattr>();
  MetadataObject md(path_, c);
  md.set("stationerypad", Value::ofBoolean(true));
  md.set("keywords", Value::ofStringList({"disk"}));

  auto raw = xattr_.read(path_, kFinderInfoKey);
  ASSERT_TRUE(raw);
  EXPECT_EQ(raw->size(), kFinderInfoSize);
  EXPECT_TRUE(decode_stationery(toFinderInfoRecord(*raw)));
  EXPECT_EQ(md.get("keywords"), Value::ofStringList({"disk"}));
}
