#include <gtest/gtest.h>

#include <algorithm>

#include "../src/utils/diff_utils.hpp"

using diff_utils::unified_diff;

TEST(DiffUtilsTest, IdenticalInputsProduceNothing) {
    EXPECT_TRUE(unified_diff({"a", "b"}, {"a", "b"}, "x", "y").empty());
    EXPECT_TRUE(unified_diff({}, {}, "x", "y").empty());
}

TEST(DiffUtilsTest, SingleChangeWithContext) {
    const std::vector<std::string> expected = {"--- before", "+++ after", "@@ -1,3 +1,3 @@", " a", "-b", "+x", " c"};

    EXPECT_EQ(unified_diff({"a", "b", "c"}, {"a", "x", "c"}, "before", "after"), expected);
}

TEST(DiffUtilsTest, AddedToEmptyInput) {
    const std::vector<std::string> expected = {"--- before", "+++ after", "@@ -0,0 +1,2 @@", "+a", "+b"};

    EXPECT_EQ(unified_diff({}, {"a", "b"}, "before", "after"), expected);
}

TEST(DiffUtilsTest, SingleLineRangesOmitLength) {
    const std::vector<std::string> expected = {"--- before", "+++ after", "@@ -1 +1 @@", "-a", "+b"};

    EXPECT_EQ(unified_diff({"a"}, {"b"}, "before", "after"), expected);
}

TEST(DiffUtilsTest, DistantChangesGetSeparateHunks) {
    std::vector<std::string> before;
    for (int i = 1; i <= 20; ++i) {
        before.push_back(std::to_string(i));
    }
    std::vector<std::string> after = before;
    after[1] = "two";
    after[17] = "eighteen";

    const auto lines = unified_diff(before, after, "before", "after");

    std::vector<std::string> headers;
    for (const auto& line : lines) {
        if (line.starts_with("@@")) {
            headers.push_back(line);
        }
    }
    const std::vector<std::string> expected = {"@@ -1,5 +1,5 @@", "@@ -15,6 +15,6 @@"};
    EXPECT_EQ(headers, expected);
}

TEST(DiffUtilsTest, NearbyChangesShareAHunk) {
    const std::vector<std::string> before = {"1", "2", "3", "4", "5", "6", "7", "8", "9"};
    std::vector<std::string> after = before;
    after[0] = "one";
    after[7] = "eight";

    const auto lines = unified_diff(before, after, "before", "after");

    ASSERT_GE(lines.size(), 3U);
    EXPECT_EQ(lines[2], "@@ -1,9 +1,9 @@");
    EXPECT_EQ(std::count_if(lines.begin(), lines.end(), [](const std::string& line) { return line.starts_with("@@"); }), 1);
}
