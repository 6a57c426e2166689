/**
 * @file unit.hpp
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"

namespace deltatest
{

/**
 * @brief One testable unit (crate) of the workspace.
 *
 * @details
 * Units are produced by the workspace metadata provider and handed to
 * `UnitGraph::build()`, which normalizes `root` and then never changes them.
 */
struct Unit
{
    /// Unique, stable identifier.
    UnitId id;

    /// Human-readable name; used for ordering and reporting.
    std::string name;

    /// Absolute root directory of the unit.
    std::filesystem::path root;

    /// Identifiers of the units this unit depends on, in declaration order.
    std::vector<UnitId> dependencies;
};

} // namespace deltatest
