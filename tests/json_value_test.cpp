#include <gtest/gtest.h>

#include "../src/json/value.hpp"

TEST(JsonValueTest, ParsesNestedDocument) {
    const json::Value doc = json::Value::parse(R"({"name": "x", "n": 3, "pi": 3.5, "ok": true, "none": null, "list": [1, "two"]})");

    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ(doc.find("name")->as_string(), "x");
    EXPECT_TRUE(doc.find("n")->is_int());
    EXPECT_EQ(doc.find("n")->as_int(), 3);
    EXPECT_DOUBLE_EQ(doc.find("pi")->as_double(), 3.5);
    EXPECT_TRUE(doc.find("ok")->as_bool());
    EXPECT_TRUE(doc.find("none")->is_null());
    EXPECT_EQ(doc.find("list")->as_array().size(), 2U);
    EXPECT_EQ(doc.find("missing"), nullptr);
}

TEST(JsonValueTest, ParsesScalarDocuments) {
    EXPECT_EQ(json::Value::parse("42").as_int(), 42);
    EXPECT_EQ(json::Value::parse(R"("hi")").as_string(), "hi");
    EXPECT_TRUE(json::Value::parse("null").is_null());
}

TEST(JsonValueTest, KeepsIntegersBeyondInt64) {
    const json::Value doc = json::Value::parse(R"({"id": 18446744073709551615, "big": 123456789012345678901234567890, "n": -1})");

    EXPECT_EQ(doc.dump(), R"({"id": 18446744073709551615, "big": 123456789012345678901234567890, "n": -1})");
    EXPECT_TRUE(doc.find("big")->is_number());
    EXPECT_EQ(json::Value::parse(" 123456789012345678901234567890\n").dump(), "123456789012345678901234567890");
    EXPECT_EQ(json::Value::parse("[18446744073709551615]").dump(2), "[\n  18446744073709551615\n]");
}

TEST(JsonValueTest, RejectsInvalidJson) {
    EXPECT_THROW((void)json::Value::parse("{not json"), json::ParseError);
    EXPECT_THROW((void)json::Value::parse("not json"), json::ParseError);
}

TEST(JsonValueTest, KeepsInsertionOrder) {
    json::Value doc{json::Object{}};
    doc.set("z", 1);
    doc.set("a", 2);
    doc.set("z", 3);

    EXPECT_EQ(doc.dump(), R"({"z": 3, "a": 2})");
}

TEST(JsonValueTest, DumpsIndented) {
    json::Value doc{json::Object{}};
    doc.set("a", 1);
    doc.set("b", json::Array{json::Value(true), json::Value(nullptr)});
    doc.set("c", json::Object{});

    EXPECT_EQ(doc.dump(2), "{\n  \"a\": 1,\n  \"b\": [\n    true,\n    null\n  ],\n  \"c\": {}\n}");
}

TEST(JsonValueTest, EscapesStrings) {
    EXPECT_EQ(json::Value("a\"b\\c\nd").dump(), R"("a\"b\\c\nd")");
}

TEST(JsonValueTest, WholeDoublesKeepDecimalPoint) {
    EXPECT_EQ(json::Value(2.0).dump(), "2.0");
    EXPECT_EQ(json::Value(12.5).dump(), "12.5");
}

TEST(JsonValueTest, EraseAndEquality) {
    json::Value doc = json::Value::parse(R"({"a": 1, "b": 2})");

    EXPECT_TRUE(doc.erase("a"));
    EXPECT_FALSE(doc.erase("a"));
    EXPECT_EQ(doc, json::Value::parse(R"({"b": 2.0})"));
    EXPECT_NE(doc, json::Value::parse(R"({"b": 3})"));
}

TEST(JsonValueTest, StringOrFallsBack) {
    const json::Value doc = json::Value::parse(R"({"s": "v", "n": 1})");

    EXPECT_EQ(doc.string_or("s", "d"), "v");
    EXPECT_EQ(doc.string_or("n", "d"), "d");
    EXPECT_EQ(doc.string_or("x", "d"), "d");
}
