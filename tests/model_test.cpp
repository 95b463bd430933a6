#include <gtest/gtest.h>

#include <stdexcept>

#include "../src/http/model/model.hpp"
#include "../src/pipeline/model/model.hpp"

using pipeline::model::normalize_body;

TEST(ModelTest, NormalizeBodyDropsNullAndEmptyObject) {
    EXPECT_FALSE(normalize_body(std::nullopt).has_value());
    EXPECT_FALSE(normalize_body(json::Value(nullptr)).has_value());
    EXPECT_FALSE(normalize_body(json::Value(json::Object{})).has_value());
}

TEST(ModelTest, NormalizeBodyKeepsOtherValues) {
    EXPECT_TRUE(normalize_body(json::Value(json::Array{})).has_value());
    EXPECT_TRUE(normalize_body(json::Value("")).has_value());
    EXPECT_TRUE(normalize_body(json::Value::parse(R"({"a": 1})")).has_value());
}

TEST(ModelTest, DisplayFilterParsing) {
    EXPECT_EQ(pipeline::model::parse_display_filter(" Body "), pipeline::model::DisplayFilter::BODY);
    EXPECT_EQ(pipeline::model::parse_display_filter("headers"), pipeline::model::DisplayFilter::HEADERS);
    EXPECT_FALSE(pipeline::model::parse_display_filter("").has_value());
    EXPECT_THROW((void)pipeline::model::parse_display_filter("cookies"), std::runtime_error);
}

TEST(ModelTest, DescriptorRequiresUrlAndDefaultsToGet) {
    EXPECT_THROW((void)pipeline::model::descriptor_from_json(json::Value::parse(R"({"method": "GET"})")), std::runtime_error);

    const auto descriptor = pipeline::model::descriptor_from_json(json::Value::parse(R"({"url": "https://x", "headers": {"A": 1}})"));
    EXPECT_EQ(descriptor.method_, "GET");
    ASSERT_EQ(descriptor.headers_.size(), 1U);
    EXPECT_EQ(descriptor.headers_[0].second, "1");
}

TEST(ModelTest, RecordSurvivesHistoryFormat) {
    pipeline::model::ResponseRecord record;
    record.method_ = "POST";
    record.url_ = "https://example.com";
    record.body_ = json::Value::parse(R"({"a": 1})");
    record.display_filter_ = pipeline::model::DisplayFilter::STATUS;
    record.status_ = 201;
    record.reason_ = "Created";
    record.elapsed_ms_ = 12.5;
    record.size_bytes_ = 99;
    record.timestamp_ = "2024-05-01T13:45:10.123456";
    record.response_body_ = "{}";

    const auto restored = pipeline::model::record_from_json(pipeline::model::to_json(record));

    EXPECT_EQ(restored.method_, "POST");
    EXPECT_EQ(restored.status_, 201);
    EXPECT_EQ(restored.display_filter_, pipeline::model::DisplayFilter::STATUS);
    EXPECT_DOUBLE_EQ(restored.elapsed_ms_, 12.5);
    EXPECT_EQ(restored.size_bytes_, 99U);
    EXPECT_EQ(restored.timestamp_, record.timestamp_);
    EXPECT_FALSE(restored.output_file_.has_value());
}

TEST(ModelTest, OptionsDefaultsFromEmptyObject) {
    const auto options = pipeline::model::options_from_json(json::Value::parse("{}"));

    EXPECT_EQ(options.repeat_, 1);
    EXPECT_EQ(options.interval_ms_, 0);
    EXPECT_FALSE(options.dry_run_);
    EXPECT_FALSE(options.output_file_.has_value());
}

TEST(ModelTest, RepeatedHeadersAreJoined) {
    const http::model::Headers headers = {{"Set-Cookie", "a=1"}, {"Content-Type", "text/plain"}, {"set-cookie", "b=2"}};

    EXPECT_EQ(pipeline::model::headers_to_json(headers).dump(), R"({"Set-Cookie": "a=1, b=2", "Content-Type": "text/plain"})");
}

TEST(HttpModelTest, HeaderLookupIsCaseInsensitive) {
    http::model::Headers headers{{"Content-Type", "text/plain"}};

    ASSERT_NE(http::model::find_header(headers, "content-type"), nullptr);
    http::model::set_header(headers, "CONTENT-TYPE", "application/json");

    ASSERT_EQ(headers.size(), 1U);
    EXPECT_EQ(headers[0].second, "application/json");
    EXPECT_EQ(http::model::find_header(headers, "Accept"), nullptr);
}

TEST(HttpModelTest, ReasonPhrases) {
    EXPECT_EQ(http::model::reason_phrase(404), "Not Found");
    EXPECT_EQ(http::model::reason_phrase(200), "OK");
}
