#include <gtest/gtest.h>

#include <stdexcept>

#include "../src/cli/curl_command.hpp"

TEST(CurlCommandTest, ParsesMethodHeadersAndJsonBody) {
    const auto descriptor = cli::parse_curl_command(
        R"(curl -X post -H 'Content-Type: application/json' --header "X-Id:  7" -d '{"a": 1}' https://example.com/items)");

    EXPECT_EQ(descriptor.method_, "POST");
    EXPECT_EQ(descriptor.url_, "https://example.com/items");
    ASSERT_EQ(descriptor.headers_.size(), 2U);
    EXPECT_EQ(descriptor.headers_[0].second, "application/json");
    EXPECT_EQ(descriptor.headers_[1].first, "X-Id");
    EXPECT_EQ(descriptor.headers_[1].second, "7");
    ASSERT_TRUE(descriptor.body_.has_value());
    EXPECT_EQ(descriptor.body_->find("a")->as_int(), 1);
}

TEST(CurlCommandTest, NonJsonBodyIsKeptAsString) {
    const auto descriptor = cli::parse_curl_command("curl --data-raw 'a=1&b=2' https://example.com/form");

    ASSERT_TRUE(descriptor.body_.has_value());
    ASSERT_TRUE(descriptor.body_->is_string());
    EXPECT_EQ(descriptor.body_->as_string(), "a=1&b=2");
    EXPECT_EQ(descriptor.method_, "GET");
}

TEST(CurlCommandTest, RejectsOtherCommands) {
    EXPECT_THROW((void)cli::parse_curl_command("wget https://example.com"), std::runtime_error);
    EXPECT_THROW((void)cli::parse_curl_command(""), std::runtime_error);
}

TEST(CurlCommandTest, RequiresUrl) {
    EXPECT_THROW((void)cli::parse_curl_command("curl -X GET"), std::runtime_error);
}

TEST(CurlCommandTest, ExportsGetWithoutMethodFlag) {
    pipeline::model::RequestDescriptor descriptor;
    descriptor.url_ = "https://example.com/a";
    descriptor.headers_ = {{"Accept", "application/json"}};

    EXPECT_EQ(cli::to_curl_command(descriptor), "curl -H 'Accept: application/json' https://example.com/a");
}

TEST(CurlCommandTest, ExportsBodyAsCompactJson) {
    pipeline::model::RequestDescriptor descriptor;
    descriptor.method_ = "put";
    descriptor.url_ = "https://example.com/a";
    descriptor.body_ = json::Value::parse(R"({"it's": 1})");

    EXPECT_EQ(cli::to_curl_command(descriptor), R"(curl -X PUT -d '{"it'"'"'s": 1}' https://example.com/a)");
}

TEST(CurlCommandTest, ExportedCommandParsesBack) {
    pipeline::model::RequestDescriptor descriptor;
    descriptor.method_ = "POST";
    descriptor.url_ = "https://example.com/a?x=1&y=2";
    descriptor.headers_ = {{"X-Note", "it's here"}};
    descriptor.body_ = json::Value::parse(R"({"k": "v w"})");

    const auto parsed = cli::parse_curl_command(cli::to_curl_command(descriptor));

    EXPECT_EQ(parsed.method_, "POST");
    EXPECT_EQ(parsed.url_, descriptor.url_);
    EXPECT_EQ(parsed.headers_, descriptor.headers_);
    EXPECT_EQ(*parsed.body_, *descriptor.body_);
}
