/**
 * @file result_reporter.hpp
 * @brief Exit status and renderings derived from a RunReport.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/errors.hpp"
#include "deltatest/execution/run_report.hpp"
#include "deltatest/reporting/text_style.hpp"

#include <nlohmann/json.hpp>

namespace deltatest
{

/**
 * @brief Exit status for a finished run.
 * @return `TestsFailed` if any outcome is `Failed`, `Success` otherwise.
 *         Skipped outcomes never cause a failure on their own, so a dry run
 *         is always a success.
 */
ExitCode summarize(const RunReport& report) noexcept;

/**
 * @brief Structured form of one outcome.
 */
nlohmann::json outcome_to_json(const UnitOutcome& outcome);

/**
 * @brief Structured form of the whole report.
 *
 * @details
 * Layout:
 * @code
 * {
 *   "status": "success" | "failure",
 *   "dry_run": bool, "fail_fast": bool, "origin": "change_detection" | "override",
 *   "tool": "cargo", "duration_ms": 1234,
 *   "counts": {"passed": n, "failed": n, "skipped": n},
 *   "units": [{"id", "name", "status", "exit_code" (int or null),
 *              "duration_ms", "note", "output"}, ...]
 * }
 * @endcode
 */
nlohmann::json report_to_json(const RunReport& report);

/**
 * @brief Serialize JSON for output; invalid UTF-8 in captured output is
 *        replaced rather than rejected.
 */
std::string dump_json(const nlohmann::json& value, int indent = -1);

/**
 * @brief One status line per unit: `test crate <name> ... ok|FAILED|skipped`.
 */
std::string render_unit_line(const UnitOutcome& outcome, const TextStyle& style);

/**
 * @brief Output of every failed unit, followed by the list of failed units.
 * @return Empty if nothing failed.
 */
std::string render_failures(const RunReport& report);

/**
 * @brief `test result: ok. P passed; F failed; S skipped; finished in X.XXs`
 */
std::string render_summary(const RunReport& report, const TextStyle& style);

/**
 * @brief Complete human-readable report.
 *
 * @param report The report.
 * @param style Emphasis for status words.
 * @param verbose Include captured output of every unit, not only failed ones.
 */
std::string render_text(const RunReport& report, const TextStyle& style, bool verbose);

} // namespace deltatest
