/**
 * @file result_reporter_tests.cpp
 */
#include <gtest/gtest.h>
#include "deltatest/reporting/result_reporter.hpp"

using namespace deltatest;

namespace
{

UnitOutcome outcome(const std::string& id, UnitStatus status, std::optional<int> exit_code,
                    std::string output = {}, std::string note = {})
{
    UnitOutcome result;
    result.id = id;
    result.name = id;
    result.status = status;
    result.exit_code = exit_code;
    result.output = std::move(output);
    result.note = std::move(note);
    return result;
}

/// [A:Passed, B:Failed, C:Skipped]
RunReport make_failed_report()
{
    RunReport report;
    report.outcomes = {
        outcome("a", UnitStatus::Passed, 0, "a passed\n"),
        outcome("b", UnitStatus::Failed, 101, "assertion failed\n"),
        outcome("c", UnitStatus::Skipped, std::nullopt, "", "skipped after failure of b"),
    };
    report.status = RunStatus::Failure;
    report.tool = "cargo";
    report.total_duration = std::chrono::milliseconds(1234);
    return report;
}

} // namespace

// ============================================================================
// summarize
// ============================================================================

TEST(ResultReporterTests, Summarize_FailureWhenAnyFailed)
{
    EXPECT_EQ(summarize(make_failed_report()), ExitCode::TestsFailed);
}

TEST(ResultReporterTests, Summarize_SkippedIsNotFailure)
{
    RunReport report;
    report.dry_run = true;
    report.outcomes = {
        outcome("a", UnitStatus::Skipped, std::nullopt, "", "dry run"),
        outcome("b", UnitStatus::Skipped, std::nullopt, "", "dry run"),
    };
    EXPECT_EQ(summarize(report), ExitCode::Success);
}

TEST(ResultReporterTests, Summarize_EmptyReportIsSuccess)
{
    EXPECT_EQ(summarize(RunReport{}), ExitCode::Success);
}

// ============================================================================
// Structured form
// ============================================================================

TEST(ResultReporterTests, Json_ListsEveryUnit)
{
    auto doc = report_to_json(make_failed_report());

    EXPECT_EQ(doc["status"], "failure");
    EXPECT_EQ(doc["tool"], "cargo");
    EXPECT_EQ(doc["dry_run"], false);
    EXPECT_EQ(doc["origin"], "change_detection");
    EXPECT_EQ(doc["duration_ms"], 1234);
    EXPECT_EQ(doc["counts"]["passed"], 1);
    EXPECT_EQ(doc["counts"]["failed"], 1);
    EXPECT_EQ(doc["counts"]["skipped"], 1);

    const auto& units = doc["units"];
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[0]["id"], "a");
    EXPECT_EQ(units[0]["status"], "passed");
    EXPECT_EQ(units[0]["exit_code"], 0);
    EXPECT_EQ(units[1]["status"], "failed");
    EXPECT_EQ(units[1]["exit_code"], 101);
    EXPECT_EQ(units[1]["output"], "assertion failed\n");
    EXPECT_EQ(units[2]["status"], "skipped");
    EXPECT_TRUE(units[2]["exit_code"].is_null());
    EXPECT_EQ(units[2]["note"], "skipped after failure of b");
}

TEST(ResultReporterTests, Json_DumpSurvivesInvalidUtf8)
{
    RunReport report;
    report.outcomes = {outcome("a", UnitStatus::Failed, 1, std::string("bad \xff byte"))};
    std::string text = dump_json(report_to_json(report));
    EXPECT_NE(text.find("bad "), std::string::npos);
    EXPECT_NO_THROW(nlohmann::json::parse(text));
}

// ============================================================================
// Human form
// ============================================================================

TEST(ResultReporterTests, Text_UnitLinesAndSummary)
{
    std::string text = render_text(make_failed_report(), TextStyle(false), false);

    EXPECT_NE(text.find("test crate a ... ok\n"), std::string::npos);
    EXPECT_NE(text.find("test crate b ... FAILED\n"), std::string::npos);
    EXPECT_NE(text.find("test crate c ... skipped (skipped after failure of b)\n"),
              std::string::npos);
    EXPECT_NE(text.find("test result: FAILED. 1 passed; 1 failed; 1 skipped; finished in 1.23s"),
              std::string::npos);
}

TEST(ResultReporterTests, Text_FailedOutputAlwaysShown)
{
    std::string text = render_text(make_failed_report(), TextStyle(false), false);

    EXPECT_NE(text.find("failed crate output:"), std::string::npos);
    EXPECT_NE(text.find("---- b output ----\nassertion failed\n"), std::string::npos);
    EXPECT_NE(text.find("failed crates:\n    b\n"), std::string::npos);
    // Passing output is omitted unless verbose
    EXPECT_EQ(text.find("a passed"), std::string::npos);
}

TEST(ResultReporterTests, Text_VerboseIncludesPassingOutput)
{
    std::string text = render_text(make_failed_report(), TextStyle(false), true);
    EXPECT_NE(text.find("a passed"), std::string::npos);
}

TEST(ResultReporterTests, Text_SuccessSummary)
{
    RunReport report;
    report.outcomes = {outcome("a", UnitStatus::Passed, 0)};
    std::string text = render_text(report, TextStyle(false), false);
    EXPECT_NE(text.find("test result: ok. 1 passed; 0 failed; 0 skipped; finished in 0.00s"),
              std::string::npos);
    EXPECT_EQ(text.find("failed crate output"), std::string::npos);
}

TEST(ResultReporterTests, Text_ColorsStatusWords)
{
    std::string text = render_text(make_failed_report(), TextStyle(true), false);
    EXPECT_NE(text.find("\033[1;32mok\033[0m"), std::string::npos);
    EXPECT_NE(text.find("\033[1;31mFAILED\033[0m"), std::string::npos);
    EXPECT_NE(text.find("\033[1;33mskipped\033[0m"), std::string::npos);

    std::string plain = render_text(make_failed_report(), TextStyle(false), false);
    EXPECT_EQ(plain.find('\033'), std::string::npos);
}

TEST(ResultReporterTests, ColorMode_Parse)
{
    EXPECT_EQ(parse_color_mode("auto").value_or(ColorMode::Never), ColorMode::Auto);
    EXPECT_EQ(parse_color_mode("always").value_or(ColorMode::Never), ColorMode::Always);
    EXPECT_EQ(parse_color_mode("never").value_or(ColorMode::Auto), ColorMode::Never);
    EXPECT_FALSE(parse_color_mode("sometimes").has_value());
    EXPECT_TRUE(should_use_color(ColorMode::Always, -1));
    EXPECT_FALSE(should_use_color(ColorMode::Never, -1));
    EXPECT_FALSE(should_use_color(ColorMode::Auto, -1));
}
