#include "trellis/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>

namespace trellis::url {

TEST(UrlDecode, PathSegmentDecodesEscapes) {
  EXPECT_EQ(DecodePathSegment("caf%C3%A9"), std::string("caf\xC3\xA9"));
  EXPECT_EQ(DecodePathSegment("a%2Fb"), std::string("a/b"));
  EXPECT_EQ(DecodePathSegment("1+1"), std::string("1+1"));
  EXPECT_EQ(DecodePathSegment(""), std::string());
}

TEST(UrlDecode, PathSegmentRejectsInvalidEscapes) {
  EXPECT_FALSE(DecodePathSegment("%").has_value());
  EXPECT_FALSE(DecodePathSegment("ab%4").has_value());
  EXPECT_FALSE(DecodePathSegment("%zz").has_value());
}

TEST(UrlDecode, QueryComponentIsLenient) {
  EXPECT_EQ(DecodeQueryComponent("hello+world"), "hello world");
  EXPECT_EQ(DecodeQueryComponent("100%25"), "100%");
  EXPECT_EQ(DecodeQueryComponent("%zz"), "%zz");
  EXPECT_EQ(DecodeQueryComponent("50%"), "50%");
  EXPECT_EQ(DecodeQueryComponent("x%4"), "x%4");
}

TEST(UrlDecode, InPlaceReturnsNewEnd) {
  std::string buf = "a%20b%20c";
  char* end = DecodeInPlace(buf.data(), buf.data() + buf.size());
  ASSERT_NE(end, nullptr);
  EXPECT_EQ(std::string(buf.data(), end), "a b c");
}

}  // namespace trellis::url
