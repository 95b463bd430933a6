#include <gtest/gtest.h>

#include <fstream>

#include "../src/pipeline/targets/target_expander.hpp"
#include "fakes.hpp"

using pipeline::targets::expand_targets;

TEST(TargetExpanderTest, PlainUrlIsSingleTarget) {
    const auto targets = expand_targets("  https://example.com/a  ");

    ASSERT_EQ(targets.size(), 1U);
    EXPECT_EQ(targets[0], "https://example.com/a");
}

TEST(TargetExpanderTest, FileExpandsToNonBlankLinesInOrder) {
    test_support::TempDir dir;
    const auto file = dir.path() / "urls.txt";
    {
        std::ofstream out(file);
        out << "https://a.example\r\n\n   \n  https://b.example  \nhttps://c.example";
    }

    const auto targets = expand_targets(file.string());

    ASSERT_EQ(targets.size(), 3U);
    EXPECT_EQ(targets[0], "https://a.example");
    EXPECT_EQ(targets[1], "https://b.example");
    EXPECT_EQ(targets[2], "https://c.example");
}

TEST(TargetExpanderTest, EmptyFileHasNoTargets) {
    test_support::TempDir dir;
    const auto file = dir.path() / "empty.txt";
    { std::ofstream out(file); }

    EXPECT_TRUE(expand_targets(file.string()).empty());
}

TEST(TargetExpanderTest, DirectoryIsNotExpanded) {
    test_support::TempDir dir;

    const auto targets = expand_targets(dir.path().string());

    ASSERT_EQ(targets.size(), 1U);
    EXPECT_EQ(targets[0], dir.path().string());
}
