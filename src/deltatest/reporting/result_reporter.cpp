/**
 * @file result_reporter.cpp
 */
#include "deltatest/reporting/result_reporter.hpp"

#include <iomanip>
#include <sstream>

namespace deltatest
{

ExitCode summarize(const RunReport& report) noexcept
{
    return report.failed_count() == 0 ? ExitCode::Success : ExitCode::TestsFailed;
}

nlohmann::json outcome_to_json(const UnitOutcome& outcome)
{
    nlohmann::json unit;
    unit["id"] = outcome.id;
    unit["name"] = outcome.name;
    unit["status"] = to_string(outcome.status);
    if (outcome.exit_code)
    {
        unit["exit_code"] = *outcome.exit_code;
    }
    else
    {
        unit["exit_code"] = nullptr;
    }
    unit["duration_ms"] = outcome.duration.count();
    unit["note"] = outcome.note;
    unit["output"] = outcome.output;
    return unit;
}

nlohmann::json report_to_json(const RunReport& report)
{
    nlohmann::json doc;
    doc["status"] = to_string(report.status);
    doc["dry_run"] = report.dry_run;
    doc["fail_fast"] = report.fail_fast;
    doc["origin"] = to_string(report.origin);
    doc["tool"] = report.tool;
    doc["duration_ms"] = report.total_duration.count();
    doc["counts"] = {
        {"passed", report.passed_count()},
        {"failed", report.failed_count()},
        {"skipped", report.skipped_count()},
    };

    nlohmann::json units = nlohmann::json::array();
    for (const auto& outcome : report.outcomes)
    {
        units.push_back(outcome_to_json(outcome));
    }
    doc["units"] = std::move(units);
    return doc;
}

std::string dump_json(const nlohmann::json& value, int indent)
{
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// Human-readable form
// ============================================================================

std::string render_unit_line(const UnitOutcome& outcome, const TextStyle& style)
{
    std::string line = "test crate " + outcome.name + " ... ";
    switch (outcome.status)
    {
    case UnitStatus::Passed:
        line += style.green("ok");
        break;
    case UnitStatus::Failed:
        line += style.red("FAILED");
        break;
    case UnitStatus::Skipped:
        line += style.yellow("skipped");
        break;
    }
    if (!outcome.note.empty() && outcome.status != UnitStatus::Failed)
    {
        line += " (" + outcome.note + ")";
    }
    return line + "\n";
}

std::string render_failures(const RunReport& report)
{
    std::vector<const UnitOutcome*> failures;
    for (const auto& outcome : report.outcomes)
    {
        if (outcome.status == UnitStatus::Failed)
        {
            failures.push_back(&outcome);
        }
    }
    if (failures.empty())
    {
        return {};
    }

    std::ostringstream oss;
    oss << "\nfailed crate output:\n\n";
    for (const auto* outcome : failures)
    {
        oss << "---- " << outcome->name << " output ----\n" << outcome->output;
        if (!outcome->output.empty() && outcome->output.back() != '\n')
        {
            oss << '\n';
        }
        oss << '\n';
    }
    oss << "failed crates:\n";
    for (const auto* outcome : failures)
    {
        oss << "    " << outcome->name << '\n';
    }
    return oss.str();
}

std::string render_summary(const RunReport& report, const TextStyle& style)
{
    double seconds = static_cast<double>(report.total_duration.count()) / 1000.0;

    std::ostringstream oss;
    oss << "test result: " << (report.failed_count() == 0 ? style.green("ok") : style.red("FAILED"))
        << ". " << report.passed_count() << " passed; " << report.failed_count() << " failed; "
        << report.skipped_count() << " skipped; finished in " << std::fixed
        << std::setprecision(2) << seconds << "s\n";
    return oss.str();
}

std::string render_text(const RunReport& report, const TextStyle& style, bool verbose)
{
    std::ostringstream oss;
    for (const auto& outcome : report.outcomes)
    {
        oss << render_unit_line(outcome, style);
        if (verbose && outcome.status == UnitStatus::Passed && !outcome.output.empty())
        {
            oss << outcome.output;
            if (outcome.output.back() != '\n')
            {
                oss << '\n';
            }
        }
    }
    oss << render_failures(report);
    oss << '\n' << render_summary(report, style);
    return oss.str();
}

} // namespace deltatest
