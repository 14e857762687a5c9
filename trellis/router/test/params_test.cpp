#include "trellis/params.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/extraction-error.hpp"
#include "trellis/http-status-code.hpp"

using namespace trellis;

namespace {

struct Slug {
  static Slug FromParam(std::string_view text) {
    if (text.find(' ') != std::string_view::npos) {
      throw ExtractionError("slug", "slug cannot contain spaces");
    }
    return Slug{std::string(text)};
  }

  std::string value;
};

}  // namespace

TEST(ParamsTest, TypedAccess) {
  PathParams params;
  params.add("id", "42");
  params.add("ratio", "0.5");
  params.add("flag", "true");
  params.add("name", "widget");

  EXPECT_EQ(params.get<int>("id"), 42);
  EXPECT_EQ(params.get<uint64_t>("id"), 42U);
  EXPECT_DOUBLE_EQ(params.get<double>("ratio"), 0.5);
  EXPECT_TRUE(params.get<bool>("flag"));
  EXPECT_EQ(params.get<std::string>("name"), "widget");
  EXPECT_EQ(params.get<Slug>("name").value, "widget");
  EXPECT_EQ(params.size(), 4U);
  EXPECT_TRUE(params.contains("ratio"));
  EXPECT_FALSE(params.contains("other"));
}

TEST(ParamsTest, InvalidValueIsExtractionError) {
  PathParams params;
  params.add("id", "12a");
  params.add("neg", "-1");
  params.add("flag", "maybe");
  params.add("empty", "");

  EXPECT_THROW((void)params.get<int>("id"), ExtractionError);
  EXPECT_THROW((void)params.get<unsigned>("neg"), ExtractionError);
  EXPECT_THROW((void)params.get<bool>("flag"), ExtractionError);
  EXPECT_THROW((void)params.get<int>("empty"), ExtractionError);
  try {
    (void)params.get<int>("id");
    FAIL() << "expected ExtractionError";
  } catch (const ExtractionError& ex) {
    EXPECT_EQ(ex.param(), "id");
    EXPECT_EQ(ex.status(), http::StatusCodeBadRequest);
    EXPECT_EQ(std::string_view(ex.what()), "invalid value '12a' for parameter 'id'");
  }
}

TEST(ParamsTest, MissingParameter) {
  PathParams params;
  EXPECT_THROW((void)params.get<std::string>("id"), ExtractionError);
  EXPECT_EQ(params.getOptional<int>("id"), std::nullopt);
  EXPECT_TRUE(params.getAll<int>("id").empty());

  params.add("id", "x");
  EXPECT_THROW((void)params.getOptional<int>("id"), ExtractionError);
}

TEST(ParamsTest, MultipleValues) {
  PathParams params;
  params.add("rest", "a");
  params.add("rest", "b");
  params.add("rest", "c");

  const auto all = params.getAll<std::string>("rest");
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0], "a");
  EXPECT_EQ(all[1], "b");
  EXPECT_EQ(all[2], "c");
  EXPECT_EQ(params.values("rest").size(), 3U);
  EXPECT_EQ(params.value("rest"), "a");
}

TEST(ParamsTest, ValuesAreNotDecodedTwice) {
  PathParams params;
  params.add("name", "100%25 a+b");

  EXPECT_EQ(params.value("name"), "100%25 a+b");
  EXPECT_EQ(params.get<std::string>("name"), "100%25 a+b");
}

TEST(ParamsTest, Append) {
  PathParams lhs;
  lhs.add("version", "v1");
  PathParams rhs;
  rhs.add("id", "7");
  lhs.append(rhs);
  EXPECT_EQ(lhs.get<std::string>("version"), "v1");
  EXPECT_EQ(lhs.get<int>("id"), 7);
}

TEST(QueryStringTest, ParseFormEncoded) {
  const QueryParams params = ParseQueryString("a=1&b=hello+world&a=2&flag&&c=%41%zz");
  EXPECT_EQ(params.getAll<int>("a").size(), 2U);
  EXPECT_EQ(params.getAll<int>("a")[1], 2);
  EXPECT_EQ(params.get<std::string>("b"), "hello world");
  EXPECT_TRUE(params.contains("flag"));
  EXPECT_EQ(params.value("flag"), "");
  EXPECT_EQ(params.get<std::string>("c"), "A%zz");
  EXPECT_EQ(params.size(), 5U);
}

TEST(QueryStringTest, EmptyQuery) {
  EXPECT_TRUE(ParseQueryString("").empty());
  EXPECT_TRUE(ParseQueryString("&&").empty());
}

TEST(QueryStringTest, EncodedKeys) {
  const QueryParams params = ParseQueryString("first%20name=Ada&x=a%3Db");
  EXPECT_EQ(params.get<std::string>("first name"), "Ada");
  EXPECT_EQ(params.get<std::string>("x"), "a=b");
}
