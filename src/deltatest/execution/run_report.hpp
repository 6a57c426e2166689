/**
 * @file run_report.hpp
 * @brief Per-unit outcomes and the aggregate RunReport produced by a test run.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"

namespace deltatest
{

/**
 * @brief Result of attempting to test one unit.
 */
struct UnitOutcome
{
    UnitId id;

    /// Display name of the unit.
    std::string name;

    UnitStatus status{UnitStatus::Skipped};

    /// Captured combined output; empty when the unit was not run.
    std::string output;

    /// Exit code of the test command; absent when the command never ran
    /// (skipped, or could not be started).
    std::optional<int> exit_code;

    /// Short explanation, e.g. "dry run" or a start-failure message.
    std::string note;

    std::chrono::milliseconds duration{0};
};

/**
 * @brief Aggregate result of one run.
 *
 * @details
 * Outcomes appear in the order the units were attempted, and every unit of
 * the affected set has exactly one outcome.
 */
struct RunReport
{
    std::vector<UnitOutcome> outcomes;

    /// `Success` iff no outcome is `Failed`.
    RunStatus status{RunStatus::Success};

    bool dry_run{false};
    bool fail_fast{true};
    AffectedOrigin origin{AffectedOrigin::ChangeDetection};

    /// Name of the test tool ("cargo", "nextest").
    std::string tool;

    std::chrono::milliseconds total_duration{0};

    size_t count(UnitStatus wanted) const noexcept
    {
        return static_cast<size_t>(
            std::count_if(outcomes.begin(), outcomes.end(),
                          [wanted](const UnitOutcome& o) { return o.status == wanted; }));
    }

    size_t passed_count() const noexcept
    {
        return count(UnitStatus::Passed);
    }

    size_t failed_count() const noexcept
    {
        return count(UnitStatus::Failed);
    }

    size_t skipped_count() const noexcept
    {
        return count(UnitStatus::Skipped);
    }

    bool success() const noexcept
    {
        return status == RunStatus::Success;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = success() ? "Run succeeded" : "Run failed";
        if (dry_run)
        {
            result += " (dry run)";
        }
        result += " (passed=" + std::to_string(passed_count());
        result += ", failed=" + std::to_string(failed_count());
        result += ", skipped=" + std::to_string(skipped_count()) + ")";
        return result;
    }
};

} // namespace deltatest
