#include <gtest/gtest.h>

#include "../src/cli/arguments.hpp"

namespace {
    const std::vector<cli::FlagSpec> SPECS = {
        {.short_ = "-o", .long_ = "--output", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
        {.short_ = "", .long_ = "--only", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {"body", "headers", "status"},
         .error_message_ = "Invalid --only"},
        {.short_ = "-r", .long_ = "--repeat", .takes_value_ = true, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
        {.short_ = "-dr", .long_ = "--dry-run", .takes_value_ = false, .is_required_ = false, .allowed_values_ = {}, .error_message_ = ""},
    };
}  // namespace

TEST(ArgumentsTest, ParsesValuesSwitchesAndPositionals) {
    const auto parsed = cli::parse_arguments({"GET", "-o", "out.txt", "--only=body", "-dr", "https://x"}, SPECS);

    EXPECT_EQ(parsed.get("--output"), "out.txt");
    EXPECT_EQ(parsed.get_or("--only", ""), "body");
    EXPECT_TRUE(parsed.has("--dry-run"));
    EXPECT_FALSE(parsed.has("--repeat"));
    ASSERT_EQ(parsed.positional().size(), 2U);
    EXPECT_EQ(parsed.positional()[0], "GET");
    EXPECT_EQ(parsed.positional()[1], "https://x");
}

TEST(ArgumentsTest, NegativeNumbersArePositional) {
    const auto parsed = cli::parse_arguments({"-5"}, SPECS);

    ASSERT_EQ(parsed.positional().size(), 1U);
    EXPECT_EQ(parsed.positional()[0], "-5");
}

TEST(ArgumentsTest, IntegerValues) {
    const auto parsed = cli::parse_arguments({"-r", "3"}, SPECS);
    EXPECT_EQ(parsed.get_long("--repeat", 1), 3);
    EXPECT_EQ(parsed.get_long("--missing", 9), 9);

    const auto bad = cli::parse_arguments({"-r", "three"}, SPECS);
    EXPECT_THROW((void)bad.get_long("--repeat", 1), cli::UsageError);
}

TEST(ArgumentsTest, UsageErrors) {
    EXPECT_THROW((void)cli::parse_arguments({"--nope"}, SPECS), cli::UsageError);
    EXPECT_THROW((void)cli::parse_arguments({"-o"}, SPECS), cli::UsageError);
    EXPECT_THROW((void)cli::parse_arguments({"--only", "cookies"}, SPECS), cli::UsageError);
    EXPECT_THROW((void)cli::parse_arguments({"--dry-run=yes"}, SPECS), cli::UsageError);
}

TEST(ArgumentsTest, RequiredFlagMessage) {
    std::vector<cli::FlagSpec> specs = SPECS;
    specs.push_back({.short_ = "-n", .long_ = "--name", .takes_value_ = true, .is_required_ = true, .allowed_values_ = {},
                     .error_message_ = "--name is required"});

    try {
        (void)cli::parse_arguments({}, specs);
        FAIL() << "expected UsageError";
    } catch (const cli::UsageError& e) {
        EXPECT_STREQ(e.what(), "--name is required");
    }
}
