/**
 * @file affected_set.hpp
 * @brief The ordered set of units selected for testing.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"
#include "deltatest/graph/unit_graph.hpp"

namespace deltatest
{

/**
 * @brief One unit of an affected set.
 */
struct AffectedEntry
{
    UnitId id;

    /// True if the unit was changed (or named explicitly), false if it was
    /// pulled in as a dependent of a changed unit.
    bool direct = true;
};

/**
 * @brief Ordered units to test, plus how they were chosen.
 *
 * @details
 * Entries are sorted by display name, then by identifier, so identical input
 * always yields an identical test order.
 */
struct AffectedSet
{
    AffectedOrigin origin = AffectedOrigin::ChangeDetection;
    std::vector<AffectedEntry> entries;

    bool empty() const noexcept
    {
        return entries.empty();
    }

    size_t size() const noexcept
    {
        return entries.size();
    }

    /// Identifiers in test order.
    std::vector<UnitId> ids() const;

    size_t direct_count() const noexcept;

    size_t dependent_count() const noexcept
    {
        return entries.size() - direct_count();
    }
};

/**
 * @brief Build the affected set from the directly changed units.
 *
 * @param direct Directly changed units, as returned by `resolve()`.
 * @param graph The unit graph.
 * @param include_dependents If true, add every unit that transitively depends
 *        on a changed unit.
 * @throw GraphError with `UnknownUnit` if `direct` names an unknown unit.
 */
AffectedSet expand(const UnitIdSet& direct, const UnitGraph& graph, bool include_dependents);

/**
 * @brief Build the affected set from an explicit list of units (re-run mode).
 *
 * @details
 * Change detection and expansion are bypassed. Duplicate identifiers are
 * removed and the result is sorted like any other affected set.
 *
 * @throw GraphError with `UnknownDependency` naming every identifier that is
 *        not in the graph.
 */
AffectedSet from_override(const std::vector<UnitId>& ids, const UnitGraph& graph);

} // namespace deltatest
