#include "trellis/path-pattern.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "trellis/vector.hpp"

using namespace trellis;

namespace {

std::vector<std::string> Split(std::string_view path, bool keepTrailingEmpty) {
  vector<std::string_view> segments;
  SplitPathSegments(path, keepTrailingEmpty, segments);
  return {segments.begin(), segments.end()};
}

}  // namespace

TEST(PathPatternTest, RootHasNoSegment) {
  EXPECT_TRUE(CompilePathPattern("/").empty());
  EXPECT_EQ(PatternToString(CompilePathPattern("/")), "/");
}

TEST(PathPatternTest, AllSegmentKinds) {
  const PathPattern pattern = CompilePathPattern("/items/:id|[0-9]+/:name/*rest");
  ASSERT_EQ(pattern.size(), 4U);
  EXPECT_EQ(pattern[0].kind, PatternSegment::Kind::Literal);
  EXPECT_EQ(pattern[0].text, "items");
  EXPECT_EQ(pattern[1].kind, PatternSegment::Kind::Constrained);
  EXPECT_EQ(pattern[1].text, "id");
  EXPECT_EQ(pattern[1].regex, "[0-9]+");
  EXPECT_EQ(pattern[2].kind, PatternSegment::Kind::Dynamic);
  EXPECT_EQ(pattern[2].text, "name");
  EXPECT_EQ(pattern[3].kind, PatternSegment::Kind::Glob);
  EXPECT_EQ(pattern[3].text, "rest");
  EXPECT_EQ(PatternToString(pattern), "/items/:id|[0-9]+/:name/*rest");
}

TEST(PathPatternTest, TrailingSlashIgnored) {
  EXPECT_EQ(CompilePathPattern("/a/b/"), CompilePathPattern("/a/b"));
}

TEST(PathPatternTest, RegexMayContainSpecialCharacters) {
  const PathPattern pattern = CompilePathPattern("/v/:ver|v[0-9]{1,2}");
  ASSERT_EQ(pattern.size(), 2U);
  EXPECT_EQ(pattern[1].regex, "v[0-9]{1,2}");
}

TEST(PathPatternTest, MalformedPatternsThrow) {
  EXPECT_THROW(CompilePathPattern(""), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("a/b"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("//"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/a//b"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/a//"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/:"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/*"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/:|[0-9]+"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/:id|"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/:id|[0-9"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/:bad-name"), std::invalid_argument);
  EXPECT_THROW(CompilePathPattern("/*rest/tail"), std::invalid_argument);
}

TEST(PathPatternTest, JoinPatterns) {
  EXPECT_EQ(JoinPatterns("/", "/"), "/");
  EXPECT_EQ(JoinPatterns("/", "/a"), "/a");
  EXPECT_EQ(JoinPatterns("/checkout", "/start"), "/checkout/start");
  EXPECT_EQ(JoinPatterns("/checkout/", "start"), "/checkout/start");
  EXPECT_EQ(JoinPatterns("", "x"), "/x");
  EXPECT_EQ(JoinPatterns("api", "/v1/:id"), "/api/v1/:id");
}

TEST(PathPatternTest, SplitPathSegments) {
  EXPECT_TRUE(Split("/", false).empty());
  EXPECT_TRUE(Split("/", true).empty());
  EXPECT_TRUE(Split("", false).empty());
  EXPECT_EQ(Split("/a/b", false), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(Split("a/b", false), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(Split("/a/b/", false), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(Split("/a/b/", true), (std::vector<std::string>{"a", "b", ""}));
  EXPECT_EQ(Split("/a//b", false), (std::vector<std::string>{"a", "", "b"}));
  EXPECT_EQ(Split("/a%2Fb/c", false), (std::vector<std::string>{"a%2Fb", "c"}));
}
