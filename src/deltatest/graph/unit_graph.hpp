/**
 * @file unit_graph.hpp
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/errors.hpp"
#include "deltatest/common/unit_types.hpp"
#include "deltatest/graph/graph_diagnostics.hpp"
#include "deltatest/graph/unit.hpp"

namespace deltatest
{

/**
 * @brief Immutable graph of workspace units and their dependency edges.
 *
 * @details
 * `UnitGraph` owns every `Unit` of the workspace together with a reverse
 * dependency index (unit -> units that depend on it). Both are computed
 * once in `build()`; afterwards the graph is read-only and is passed
 * explicitly to every component that needs it.
 *
 * @par Edge direction
 * A unit's `dependencies` are its forward edges. The reverse index is exactly
 * their transpose: `dependents_of(x)` contains `y` iff `y` lists `x` as a
 * dependency.
 *
 * @par Malformed data
 * References to unknown units, duplicate identifiers and empty identifiers
 * are errors and make `build()` throw. Cycles, self-dependencies and nested
 * roots are only reported as warnings: metadata sources can legitimately
 * produce them, and every traversal guards against revisiting units.
 *
 * @par Thread safety
 * - No internal synchronization; all query methods are const.
 * - Concurrent reads are safe.
 */
class UnitGraph
{
public:
    /**
     * @brief Build a graph from already-resolved units.
     * @param units The units; each carries its declared dependency identifiers.
     *        Root directories are normalized lexically.
     * @return The built graph.
     * @throw GraphError with `UnknownDependency` if a dependency names a unit
     *        that is not in `units`, `DuplicateUnit` if an identifier repeats,
     *        or `InvalidUnit` if an identifier is empty or a root is not an
     *        absolute path. All problems are reported in one exception, whose
     *        `diagnostics()` lists each of them.
     */
    static UnitGraph build(std::vector<Unit> units);

    /**
     * @brief Get the number of units in the graph.
     */
    size_t size() const noexcept
    {
        return m_units.size();
    }

    /**
     * @brief Get all units, in the order they were given to `build()`.
     */
    const std::vector<Unit>& units() const noexcept
    {
        return m_units;
    }

    /**
     * @brief Check whether a unit with the given identifier exists.
     */
    bool contains(const UnitId& id) const;

    /**
     * @brief Look up a unit by identifier.
     * @return Pointer to the unit, or nullptr if there is no such unit.
     */
    const Unit* find(const UnitId& id) const;

    /**
     * @brief Look up a unit by identifier.
     * @throw GraphError with `UnknownUnit` if there is no such unit.
     */
    const Unit& at(const UnitId& id) const;

    /**
     * @brief Find the unit whose root directory contains a path.
     *
     * @param path A file path. It is normalized before matching; relative
     *        paths never match since unit roots are absolute.
     * @return The unit with the deepest root that is an ancestor of (or equal
     *         to) `path`, or `std::nullopt` if no unit claims it (for example a
     *         workspace-level lockfile).
     *
     * @note Matching is per path component: a root `/ws/foo` does not
     *       contain `/ws/foobar/lib.rs`.
     */
    std::optional<UnitId> unit_containing(const std::filesystem::path& path) const;

    /**
     * @brief Get the direct dependents of a unit (one hop).
     * @throw GraphError with `UnknownUnit` if there is no such unit.
     */
    const UnitIdSet& dependents_of(const UnitId& id) const;

    /**
     * @brief Get every unit that transitively depends on any unit of `initial`.
     *
     * @details
     * Breadth-first traversal over the reverse index starting from every
     * member of `initial`. A visited set guarantees termination on cyclic
     * data. The result always contains `initial`.
     *
     * @throw GraphError with `UnknownUnit` if `initial` names an unknown unit.
     */
    UnitIdSet transitive_dependents_of(const UnitIdSet& initial) const;

    /**
     * @brief Warnings collected while building the graph.
     */
    const GraphDiagnostics& diagnostics() const noexcept
    {
        return *m_diagnostics;
    }

private:
    UnitGraph() = default;

    /// Validate units; errors and warnings are added to `diagnostics`.
    static void validate_units(const std::vector<Unit>& units, GraphDiagnostics& diagnostics);

    /// Fill the reverse index from the forward edges.
    void index_dependents();

    /// Report units that take part in dependency cycles.
    void detect_cycles(GraphDiagnostics& diagnostics) const;

    /// Report unit roots nested inside (or equal to) other unit roots.
    void detect_nested_roots(GraphDiagnostics& diagnostics) const;

    // -------------------------------------------------------------------------
    // Unit storage
    // -------------------------------------------------------------------------

    /// Units in construction order.
    std::vector<Unit> m_units;

    /// Identifier -> position in m_units.
    std::unordered_map<UnitId, size_t> m_positions;

    // -------------------------------------------------------------------------
    // Reverse index
    // -------------------------------------------------------------------------

    /// Identifier -> identifiers of units that list it as a dependency.
    /// Every unit has an entry, possibly empty.
    std::unordered_map<UnitId, UnitIdSet> m_dependents;

    std::shared_ptr<const GraphDiagnostics> m_diagnostics;
};

} // namespace deltatest
