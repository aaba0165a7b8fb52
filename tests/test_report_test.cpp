#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "kernel/test_report.hpp"

#include <string>

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

using namespace sandpit::kernel;

const char* const PYTEST_OUTPUT =
    "============================= test session starts ==============================\n"
    "collected 5 items\n"
    "\n"
    "test_x.py ....F                                                          [100%]\n"
    "\n"
    "=================================== FAILURES ===================================\n"
    "____________________________________ test_b ____________________________________\n"
    "\n"
    "    def test_b():\n"
    ">       assert add(2, 2) == 5\n"
    "E       assert 4 == 5\n"
    "\n"
    "test_x.py:9: AssertionError\n"
    "=========================== short test summary info ============================\n"
    "FAILED test_x.py::test_b - AssertionError: assert 4 == 5\n"
    "========================= 4 passed, 1 failed in 0.12s ==========================\n";

TEST(ParseTestReportTest, CountsAndFailure) {
    auto summary = parse_test_report(PYTEST_OUTPUT);

    EXPECT_TRUE(summary.summary_found);
    EXPECT_EQ(summary.total, 5);
    EXPECT_EQ(summary.passed, 4);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.errors, 0);
    EXPECT_EQ(summary.duration, "0.12s");

    ASSERT_EQ(summary.failures.size(), 1u);
    const auto& f = summary.failures[0];
    EXPECT_EQ(f.test_name, "test_b");
    EXPECT_EQ(f.location, "test_x.py");
    EXPECT_EQ(f.error_type, "AssertionError");
    EXPECT_EQ(f.error_message, "assert 4 == 5");
    EXPECT_FALSE(f.collection_error);
    EXPECT_THAT(f.traceback, HasSubstr("assert add(2, 2) == 5"));
    EXPECT_THAT(f.traceback, Not(HasSubstr("short test summary")));
}

TEST(ParseTestReportTest, EmptyOutputIsZeroed) {
    auto summary = parse_test_report("");
    EXPECT_FALSE(summary.summary_found);
    EXPECT_EQ(summary.total, 0);
    EXPECT_EQ(summary.duration, "0s");
    EXPECT_TRUE(summary.failures.empty());
}

TEST(ParseTestReportTest, UnrelatedOutputIsZeroed) {
    auto summary = parse_test_report("hello\nworld in a while\n");
    EXPECT_FALSE(summary.summary_found);
    EXPECT_EQ(summary.total, 0);
}

TEST(ParseTestReportTest, CountsInAnyOrder) {
    auto summary = parse_test_report("== 2 skipped, 1 failed, 3 passed, 1 error in 1.5s ==\n");
    EXPECT_EQ(summary.passed, 3);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.skipped, 2);
    EXPECT_EQ(summary.errors, 1);
    EXPECT_EQ(summary.total, 7);
    EXPECT_EQ(summary.duration, "1.5s");
}

TEST(ParseTestReportTest, QuietSummaryWithoutBorders) {
    auto summary = parse_test_report("...\n3 passed in 0.01s\n");
    EXPECT_TRUE(summary.summary_found);
    EXPECT_EQ(summary.passed, 3);
    EXPECT_EQ(summary.total, 3);
}

TEST(ParseTestReportTest, LastSummaryLineWins) {
    auto summary = parse_test_report("1 passed in 0.10s\n2 passed, 2 failed in 0.20s\n");
    EXPECT_EQ(summary.passed, 2);
    EXPECT_EQ(summary.failed, 2);
    EXPECT_EQ(summary.duration, "0.20s");
}

TEST(ExtractFailuresTest, CollectionErrorLine) {
    auto failures = extract_failures(
        "ERROR tests/test_db.py - ModuleNotFoundError: No module named 'psycopg2'\n");
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_TRUE(failures[0].collection_error);
    EXPECT_EQ(failures[0].location, "tests/test_db.py");
    EXPECT_EQ(failures[0].test_name, "");
    EXPECT_EQ(failures[0].error_type, "ModuleNotFoundError");
    EXPECT_EQ(failures[0].error_message, "No module named 'psycopg2'");
}

TEST(ExtractFailuresTest, ClassNodeAndBareType) {
    auto failures = extract_failures(
        "FAILED tests/test_api.py::TestClient::test_get - KeyError\n"
        "FAILED tests/test_api.py::test_post\n");
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].test_name, "test_get");
    EXPECT_EQ(failures[0].location, "tests/test_api.py");
    EXPECT_EQ(failures[0].error_type, "KeyError");
    EXPECT_EQ(failures[0].error_message, "");
    EXPECT_EQ(failures[1].test_name, "test_post");
    EXPECT_EQ(failures[1].error_type, "");
}

TEST(ExtractFailuresTest, BareAssertIsAssertionError) {
    auto failures = extract_failures("FAILED t.py::test_a - assert 1 == 2\n");
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].error_type, "AssertionError");
    EXPECT_EQ(failures[0].error_message, "assert 1 == 2");
}

TEST(ExtractFailuresTest, TracebackExcerptIsBounded) {
    std::string output = "_____ test_long _____\n";
    for (int i = 0; i < 50; i++) {
        output += "E   line " + std::to_string(i) + " of a very long traceback\n";
    }
    output += "FAILED t.py::test_long - ValueError: bad\n";

    auto failures = extract_failures(output);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].traceback.size(), TRACEBACK_EXCERPT_LENGTH);
    EXPECT_THAT(failures[0].traceback, StartsWith("E   line 0"));
}

TEST(FormatTestSummaryTest, CountsAndDetails) {
    auto text = format_test_summary(parse_test_report(PYTEST_OUTPUT));
    EXPECT_THAT(text, HasSubstr("TEST RESULTS SUMMARY"));
    EXPECT_THAT(text, HasSubstr("Total Tests: 5"));
    EXPECT_THAT(text, HasSubstr("Passed: 4"));
    EXPECT_THAT(text, HasSubstr("Failed: 1"));
    EXPECT_THAT(text, HasSubstr("Duration: 0.12s"));
    EXPECT_THAT(text, Not(HasSubstr("Skipped:")));
    EXPECT_THAT(text, HasSubstr("FAILURE DETAILS:"));
    EXPECT_THAT(text, HasSubstr("1. test_b (test_x.py)"));
}

TEST(AnalyzeTestFailuresTest, NoFailures) {
    EXPECT_EQ(analyze_test_failures({}), "No failures to analyze.");
}

TEST(AnalyzeTestFailuresTest, SuggestionsByType) {
    TestFailure key_error;
    key_error.test_name = "test_lookup";
    key_error.location = "test_map.py";
    key_error.error_type = "KeyError";
    key_error.error_message = "'missing'";

    TestFailure other;
    other.test_name = "test_weird";
    other.location = "test_map.py";
    other.error_type = "ZeroDivisionError";

    auto text = analyze_test_failures({key_error, other});
    EXPECT_THAT(text, HasSubstr("Found 2 failing test(s):"));
    EXPECT_THAT(text, HasSubstr("Use .get() with a default value"));
    EXPECT_THAT(text, HasSubstr("Review the error message carefully"));
    EXPECT_THAT(text, HasSubstr("DEBUGGING WORKFLOW:"));
}

TEST(TestSummaryTest, JsonShape) {
    auto j = parse_test_report(PYTEST_OUTPUT).to_json();
    EXPECT_EQ(j["total"], 5);
    EXPECT_EQ(j["failures"].size(), 1u);
    EXPECT_EQ(j["failures"][0]["error_type"], "AssertionError");
}

}  // namespace
