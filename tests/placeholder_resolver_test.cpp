#include <gtest/gtest.h>

#include <string>

#include "../src/pipeline/error/pipeline_error.hpp"
#include "../src/pipeline/resolver/placeholder_resolver.hpp"

using pipeline::resolver::PlaceholderResolver;
using pipeline::resolver::VariableMap;

TEST(PlaceholderResolverTest, LeavesTextWithoutTokensUntouched) {
    VariableMap variables;
    PlaceholderResolver placeholders(variables);

    EXPECT_EQ(placeholders.resolve("https://example.com/api?q={x}"), "https://example.com/api?q={x}");
    EXPECT_EQ(placeholders.resolve("{{ spaced }}"), "{{ spaced }}");
    EXPECT_EQ(placeholders.resolve("{{}}"), "{{}}");
}

TEST(PlaceholderResolverTest, ReplacesEveryOccurrence) {
    VariableMap variables{{"host", "api.example.com"}, {"id", "42"}};
    PlaceholderResolver placeholders(variables);

    EXPECT_EQ(placeholders.resolve("https://{{host}}/users/{{id}}?again={{id}}"), "https://api.example.com/users/42?again=42");
}

TEST(PlaceholderResolverTest, TripleBracesKeepOuterBraces) {
    VariableMap variables{{"x", "v"}};
    PlaceholderResolver placeholders(variables);

    EXPECT_EQ(placeholders.resolve("{{{x}}}"), "{v}");
}

TEST(PlaceholderResolverTest, ResolvesNestedJsonStringsOnly) {
    VariableMap variables{{"name", "alice"}, {"tag", "admin"}};
    PlaceholderResolver placeholders(variables);

    const json::Value body = json::Value::parse(R"({"user": "{{name}}", "count": 3, "tags": ["{{tag}}", true], "{{name}}": null})");
    const json::Value resolved = placeholders.resolve(body);

    EXPECT_EQ(resolved.find("user")->as_string(), "alice");
    EXPECT_EQ(resolved.find("count")->as_int(), 3);
    EXPECT_EQ(resolved.find("tags")->as_array()[0].as_string(), "admin");
    EXPECT_TRUE(resolved.find("tags")->as_array()[1].as_bool());
    // Keys are not templated.
    EXPECT_NE(resolved.find("{{name}}"), nullptr);
}

TEST(PlaceholderResolverTest, ResolvesHeaderValues) {
    VariableMap variables{{"token", "abc"}};
    PlaceholderResolver placeholders(variables);

    const http::model::Headers headers = placeholders.resolve(http::model::Headers{{"X-Token", "{{token}}"}});

    ASSERT_EQ(headers.size(), 1U);
    EXPECT_EQ(headers[0].first, "X-Token");
    EXPECT_EQ(headers[0].second, "abc");
}

TEST(PlaceholderResolverTest, StrictModeThrowsMissingVariable) {
    VariableMap variables;
    PlaceholderResolver placeholders(variables);

    try {
        (void)placeholders.resolve("https://{{host}}/");
        FAIL() << "expected MissingVariable";
    } catch (const pipeline::error::MissingVariable& e) {
        EXPECT_EQ(e.name_, "host");
    }
}

TEST(PlaceholderResolverTest, InteractiveModeAsksOnceAndStores) {
    VariableMap variables;
    int asked = 0;
    PlaceholderResolver placeholders(variables, [&asked](const std::string& name) {
        ++asked;
        return name + "-value";
    });

    EXPECT_EQ(placeholders.resolve("{{a}}/{{a}}/{{b}}"), "a-value/a-value/b-value");
    EXPECT_EQ(asked, 2);
    EXPECT_EQ(variables.at("a"), "a-value");
    ASSERT_EQ(placeholders.captured().size(), 2U);
    EXPECT_EQ(placeholders.captured()[0], "a");
    EXPECT_EQ(placeholders.captured()[1], "b");
}

TEST(PlaceholderResolverTest, InvalidNamesStayLiteral) {
    VariableMap variables = {{"a_1", "v"}};
    PlaceholderResolver placeholders(variables);

    EXPECT_EQ(placeholders.resolve("x{{a_1}}y"), "xvy");
    EXPECT_EQ(placeholders.resolve("x{{a-1}}y"), "x{{a-1}}y");
    EXPECT_EQ(placeholders.resolve("plain"), "plain");
}
