#include <gtest/gtest.h>

#include <string>

#include "slotest/common/utf8.hpp"

namespace slotest::common {
namespace {

TEST(Utf8Test, AcceptsAsciiAndEmpty) {
  EXPECT_TRUE(IsValidUtf8(""));
  EXPECT_TRUE(IsValidUtf8("# slo: exp error"));
}

TEST(Utf8Test, AcceptsMultiByteSequences) {
  EXPECT_TRUE(IsValidUtf8("caf\xC3\xA9"));          // 2 bytes
  EXPECT_TRUE(IsValidUtf8("\xE2\x82\xAC"));         // 3 bytes, euro sign
  EXPECT_TRUE(IsValidUtf8("\xF0\x9F\x98\x80"));     // 4 bytes
  EXPECT_TRUE(IsValidUtf8("\xF4\x8F\xBF\xBF"));     // U+10FFFF
}

TEST(Utf8Test, RejectsStrayContinuationByte) {
  EXPECT_FALSE(IsValidUtf8("\x80"));
  EXPECT_FALSE(IsValidUtf8("abc\xBF"));
}

TEST(Utf8Test, RejectsTruncatedSequence) {
  EXPECT_FALSE(IsValidUtf8("\xC3"));
  EXPECT_FALSE(IsValidUtf8("\xE2\x82"));
  EXPECT_FALSE(IsValidUtf8("\xF0\x9F\x98"));
}

TEST(Utf8Test, RejectsOverlongEncodings) {
  EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));
  EXPECT_FALSE(IsValidUtf8("\xE0\x80\xAF"));
  EXPECT_FALSE(IsValidUtf8("\xF0\x80\x80\xAF"));
}

TEST(Utf8Test, RejectsSurrogatesAndOutOfRange) {
  EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));      // U+D800
  EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));  // U+110000
  EXPECT_FALSE(IsValidUtf8("\xFF"));
}

TEST(Utf8Test, AcceptsEmbeddedNul) {
  EXPECT_TRUE(IsValidUtf8(std::string("a\0b", 3)));
}

}  // namespace
}  // namespace slotest::common
