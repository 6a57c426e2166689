/**
 * @file unit_types.hpp
 */
#pragma once
#include "deltatest/common/common.hpp"

namespace deltatest
{

// ============================================================================
// Identifier type aliases
// ============================================================================

/**
 * @brief Type alias for unit identifiers.
 *
 * @details
 * `UnitId` is an opaque, stable string that identifies one unit (crate) in
 * the workspace. This alias exists for clarity in API signatures and
 * documentation, not for compile-time type safety.
 */
using UnitId = std::string;

/**
 * @brief Unordered set of unit identifiers.
 *
 * @details
 * `std::set` is used instead of a hash set so that iterating a set always
 * yields the same order for the same contents.
 */
using UnitIdSet = std::set<UnitId>;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Outcome status for one unit.
 *
 * @details
 * - `Passed`: the test command ran and exited with status 0.
 * - `Failed`: the test command exited nonzero, was killed, or could not be
 *   started at all.
 * - `Skipped`: no attempt was made (dry run, or fail-fast after an earlier
 *   failure).
 */
enum class UnitStatus
{
    Passed,
    Failed,
    Skipped
};

/**
 * @brief Overall status of a run.
 */
enum class RunStatus
{
    Success,
    Failure
};

/**
 * @brief How the affected set of a run was produced.
 */
enum class AffectedOrigin
{
    ChangeDetection,
    Override
};

/**
 * @brief Kind of change recorded for a changed file.
 */
enum class ChangeKind
{
    Added,
    Modified,
    Removed
};

/**
 * @brief The external test tool family used to test a unit.
 *
 * @details
 * The two tools share one invocation contract; the tag only changes the
 * command line that is spawned.
 */
enum class TestTool
{
    Cargo,
    Nextest
};

const char* to_string(UnitStatus status) noexcept;
const char* to_string(RunStatus status) noexcept;
const char* to_string(AffectedOrigin origin) noexcept;
const char* to_string(ChangeKind kind) noexcept;
const char* to_string(TestTool tool) noexcept;

/**
 * @brief Parse a test tool name ("cargo" or "nextest").
 * @return The tool, or `std::nullopt` if the name is not recognized.
 */
std::optional<TestTool> parse_test_tool(const std::string& name);

} // namespace deltatest
