#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "../src/pipeline/error/pipeline_error.hpp"
#include "../src/pipeline/output/output_report.hpp"
#include "fakes.hpp"

TEST(OutputReportTest, FormatsFixedLayout) {
    const std::string report =
        pipeline::output::format_report("GET", 200, "OK", {{"Content-Type", "application/json"}}, "{\n  \"ok\": true\n}");

    EXPECT_EQ(report,
              "Request Method: GET\n"
              "Status: 200 OK\n"
              "============================\n"
              "Headers:\n"
              "{\n  \"Content-Type\": \"application/json\"\n}\n"
              "============================\n"
              "Body:\n"
              "{\n  \"ok\": true\n}");
}

TEST(OutputReportTest, WritesAndOverwrites) {
    test_support::TempDir dir;
    const auto path = (dir.path() / "report.txt").string();

    pipeline::output::write_report(path, "first");
    pipeline::output::write_report(path, "second");

    std::ifstream in(path);
    std::ostringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "second");
}

TEST(OutputReportTest, UnwritablePathThrows) {
    test_support::TempDir dir;
    const auto path = (dir.path() / "missing" / "report.txt").string();

    try {
        pipeline::output::write_report(path, "x");
        FAIL() << "expected OutputWriteError";
    } catch (const pipeline::error::OutputWriteError& e) {
        EXPECT_EQ(e.path_, path);
    }
}
