#include "json_mapper.hpp"
#include <gtest/gtest.h>

using namespace weblib;

namespace {

struct Point {
  int x = 0;
  int y = 0;
};

void from_json(const nlohmann::json &json, Point &point) {
  json.at("x").get_to(point.x);
  json.at("y").get_to(point.y);
}

} // namespace

TEST(JsonMapperTest, WritesCamelCaseKeysRecursively) {
  JsonMapper mapper;
  nlohmann::json value = {
      {"user_id", 1},
      {"home_address", {{"zip_code", "123"}}},
      {"recent_orders", nlohmann::json::array({{{"order_id", 7}}})}};

  auto written = nlohmann::json::parse(mapper.write(value));
  EXPECT_EQ(written["userId"], 1);
  EXPECT_EQ(written["homeAddress"]["zipCode"], "123");
  EXPECT_EQ(written["recentOrders"][0]["orderId"], 7);
  EXPECT_FALSE(written.contains("user_id"));
}

TEST(JsonMapperTest, CamelCaseCanBeDisabled) {
  JsonMapper mapper(false);
  EXPECT_EQ(mapper.write({{"user_id", 1}}), R"({"user_id":1})");
}

TEST(JsonMapperTest, ValuesAreNotRewritten) {
  JsonMapper mapper;
  EXPECT_EQ(mapper.write({{"note", "snake_case_value"}}),
            R"({"note":"snake_case_value"})");
}

TEST(JsonMapperTest, ReadsTypedValues) {
  JsonMapper mapper;
  auto point = mapper.read<Point>(R"({"x": 3, "y": 4})");
  EXPECT_EQ(point.x, 3);
  EXPECT_EQ(point.y, 4);
}

TEST(JsonMapperTest, MalformedInputIsValidationFailure) {
  JsonMapper mapper;
  EXPECT_THROW(mapper.read("{"), ValidationException);
  EXPECT_THROW(mapper.read<Point>(R"({"x": "three"})"), ValidationException);

  try {
    mapper.read("not json");
    FAIL() << "expected ValidationException";
  } catch (const ValidationException &e) {
    ASSERT_EQ(e.getValidationErrors().size(), 1u);
    EXPECT_EQ(e.getValidationErrors()[0].field, "body");
  }
}

TEST(JsonMapperTest, ReadsBackWhatItWrites) {
  JsonMapper mapper;
  nlohmann::json note = {{"note_title", "x"},
                         {"tags_by_owner", {{"owner_id", 1}}}};

  auto written = mapper.write(note);
  EXPECT_EQ(written, R"({"noteTitle":"x","tagsByOwner":{"ownerId":1}})");
  EXPECT_EQ(mapper.read(written), note);

  auto fromClient = mapper.read(R"({"createdAt":"2024-01-01","userURL":"u"})");
  EXPECT_TRUE(fromClient.contains("created_at"));
  EXPECT_TRUE(fromClient.contains("user_url"));
}

TEST(JsonMapperTest, MapPropertiesKeepTheirKeys) {
  JsonMapper mapper;
  mapper.keepKeysOf("scores_by_user");
  EXPECT_TRUE(mapper.keepsKeysOf("scores_by_user"));

  nlohmann::json value = {
      {"scores_by_user",
       {{"john_doe", {{"best_score", 1}}}, {"jane_roe", {{"best_score", 2}}}}}};

  auto written = nlohmann::json::parse(mapper.write(value));
  ASSERT_TRUE(written.contains("scoresByUser"));
  EXPECT_EQ(written["scoresByUser"]["john_doe"]["bestScore"], 1);
  EXPECT_EQ(written["scoresByUser"]["jane_roe"]["bestScore"], 2);
  EXPECT_FALSE(written["scoresByUser"].contains("johnDoe"));

  auto read = mapper.read(written.dump());
  EXPECT_EQ(read, value);
}

TEST(JsonMapperTest, ReadLeavesKeysAloneWithoutCamelCase) {
  JsonMapper mapper(false);
  EXPECT_TRUE(mapper.read(R"({"noteTitle":"x"})").contains("noteTitle"));
}
