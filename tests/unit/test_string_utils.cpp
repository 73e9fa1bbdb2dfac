#include "string_utils.hpp"
#include <gtest/gtest.h>

using namespace weblib;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
  EXPECT_EQ(string_utils::trim("  value \t"), "value");
  EXPECT_EQ(string_utils::trim("value"), "value");
  EXPECT_EQ(string_utils::trim("   "), "");
}

TEST(StringUtilsTest, SplitTrimmedDropsEmptyParts) {
  auto parts = string_utils::split_trimmed("a, b,,c ", ',');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");
  EXPECT_EQ(parts[2], "c");
}

TEST(StringUtilsTest, CaseInsensitiveEquality) {
  EXPECT_TRUE(string_utils::iequals("Content-Type", "content-type"));
  EXPECT_FALSE(string_utils::iequals("Content-Type", "content-length"));
  EXPECT_FALSE(string_utils::iequals("abc", "abcd"));
}

TEST(StringUtilsTest, SnakeToCamel) {
  EXPECT_EQ(string_utils::snake_to_camel("user_id"), "userId");
  EXPECT_EQ(string_utils::snake_to_camel("created_at_utc"), "createdAtUtc");
  EXPECT_EQ(string_utils::snake_to_camel("already"), "already");
}

TEST(StringUtilsTest, UrlDecodeHandlesPlusDependingOnContext) {
  EXPECT_EQ(string_utils::url_decode("a%20b+c"), "a b c");
  EXPECT_EQ(string_utils::url_decode("a%20b+c", false), "a b+c");
  EXPECT_EQ(string_utils::url_decode("100%"), "100%");
}

TEST(StringUtilsTest, UrlDecodeKeepsMalformedEscapes) {
  EXPECT_EQ(string_utils::url_decode("%-1"), "%-1");
  EXPECT_EQ(string_utils::url_decode("% f", false), "% f");
  EXPECT_EQ(string_utils::url_decode("%zz%2F"), "%zz/");
  EXPECT_EQ(string_utils::url_decode("%2f%2F"), "//");
}

TEST(StringUtilsTest, EscapesRootDetectsTraversal) {
  EXPECT_TRUE(string_utils::escapes_root("../secret"));
  EXPECT_TRUE(string_utils::escapes_root("css/../../secret"));
  EXPECT_TRUE(string_utils::escapes_root("/etc/passwd"));
  EXPECT_FALSE(string_utils::escapes_root("css/swagger-ui.css"));
}

TEST(StringUtilsTest, JoinPaths) {
  EXPECT_EQ(string_utils::join_paths("swagger-ui", "index.css"),
            "swagger-ui/index.css");
  EXPECT_EQ(string_utils::join_paths("swagger-ui/", "/index.css"),
            "swagger-ui/index.css");
}

TEST(StringUtilsTest, CamelToSnake) {
  EXPECT_EQ(string_utils::camel_to_snake("userId"), "user_id");
  EXPECT_EQ(string_utils::camel_to_snake("createdAtUtc"), "created_at_utc");
  EXPECT_EQ(string_utils::camel_to_snake("userURL"), "user_url");
  EXPECT_EQ(string_utils::camel_to_snake("already_snake"), "already_snake");
  EXPECT_EQ(string_utils::camel_to_snake("_privateId"), "_private_id");
}
