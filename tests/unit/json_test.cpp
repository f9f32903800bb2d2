#include "ppeguard/json.hpp"

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace ppeguard {
namespace {

TEST(JsonTest, ParsesNestedDocument) {
    const Json doc = Json::parse(R"({"name": "gate-3", "fps": 25.5, "enabled": true,
                                      "tags": ["north", "entry"], "extra": null})");

    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ(doc["name"].as_string(), "gate-3");
    EXPECT_DOUBLE_EQ(doc["fps"].as_number(), 25.5);
    EXPECT_TRUE(doc["enabled"].as_bool());
    ASSERT_TRUE(doc["tags"].is_array());
    EXPECT_EQ(doc["tags"].as_array().size(), 2U);
    EXPECT_EQ(doc["tags"].as_array()[1].as_string(), "entry");
    EXPECT_TRUE(doc["extra"].is_null());
}

TEST(JsonTest, TypedLookupsFallBackForMissingOrNullKeys) {
    const Json doc = Json::parse(R"({"port": 1883, "server": null})");

    EXPECT_EQ(doc.get_int("port", 1), 1883);
    EXPECT_EQ(doc.get_int("keep_alive", 60), 60);
    EXPECT_EQ(doc.get_string("server", "localhost"), "localhost");
    EXPECT_FALSE(doc.get_bool("tls"));
}

TEST(JsonTest, WrongTypeThrows) {
    const Json doc = Json::parse(R"({"port": "1883"})");

    EXPECT_THROW(doc.get_int("port"), std::runtime_error);
    EXPECT_THROW(doc["port"].as_bool(), std::runtime_error);
}

TEST(JsonTest, ConstIndexOfMissingKeyThrows) {
    const Json doc = Json::object();
    EXPECT_THROW(doc["missing"], std::out_of_range);
}

TEST(JsonTest, DumpsCompactWithSortedKeysAndIntegers) {
    Json doc = Json::object();
    doc["violations"] = 3;
    doc["label"] = "no-helmet";
    doc["ratio"] = 0.5;
    doc["list"].push_back(true);
    doc["list"].push_back(Json());

    EXPECT_EQ(doc.dump(), R"({"label":"no-helmet","list":[true,null],"ratio":0.5,"violations":3})");
}

TEST(JsonTest, EscapesAndUnescapesStrings) {
    Json doc = Json::object();
    doc["message"] = "line1\nline2 \"quoted\"";

    const std::string text = doc.dump();
    EXPECT_NE(text.find("\\n"), std::string::npos);
    EXPECT_NE(text.find("\\\""), std::string::npos);
    EXPECT_EQ(Json::parse(text)["message"].as_string(), "line1\nline2 \"quoted\"");
}

TEST(JsonTest, DecodesUnicodeEscape) {
    const Json doc = Json::parse(R"({"unit": "\u00b0C"})");
    EXPECT_EQ(doc["unit"].as_string(), "\xC2\xB0" "C");
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse("{\"a\": }"), std::runtime_error);
    EXPECT_THROW(Json::parse("[1, 2"), std::runtime_error);
    EXPECT_THROW(Json::parse("{} trailing"), std::runtime_error);
}

}  // namespace
}  // namespace ppeguard
