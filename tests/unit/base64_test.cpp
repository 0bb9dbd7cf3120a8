#include <gtest/gtest.h>

#include "core/util/Base64.hpp"

using namespace filemeta;

namespace {

Bytes bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

} // namespace

TEST(Base64, EncodesWithPadding) {
  EXPECT_EQ(encodeBase64(Bytes{}), "");
  EXPECT_EQ(encodeBase64(bytes("f")), "Zg==");
  EXPECT_EQ(encodeBase64(bytes("fo")), "Zm8=");
  EXPECT_EQ(encodeBase64(bytes("foo")), "Zm9v");
  EXPECT_EQ(encodeBase64(bytes("foobar")), "Zm9vYmFy");
  EXPECT_EQ(encodeBase64(Bytes{0xFB, 0xFF}), "+/8=");
}

TEST(Base64, DecodesAndIgnoresWhitespace) {
  EXPECT_EQ(decodeBase64("").value_or(Bytes{1}), Bytes{});
  EXPECT_EQ(decodeBase64("Zm9vYmE=").value_or(Bytes()), bytes("fooba"));
  EXPECT_EQ(decodeBase64("Zm9v\nYmFy\n").value_or(Bytes()), bytes("foobar"));
  EXPECT_EQ(decodeBase64("+/8=").value_or(Bytes()), (Bytes{0xFB, 0xFF}));
}

TEST(Base64, RejectsMalformedText) {
  EXPECT_FALSE(decodeBase64("Zm9"));
  EXPECT_FALSE(decodeBase64("Zm9*"));
  EXPECT_FALSE(decodeBase64("Zg==Zm9v"));
  EXPECT_FALSE(decodeBase64("Z=9v"));
  EXPECT_FALSE(decodeBase64("Zm=v"));
}
