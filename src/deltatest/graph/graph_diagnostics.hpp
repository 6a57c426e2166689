/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"

namespace deltatest
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Data-quality issue the graph tolerates.
    Error     ///< Blocking issue that prevents the graph from being built.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    UnknownDependency,  ///< A dependency names a unit that does not exist.
    DuplicateUnit,      ///< Two units share one identifier.
    InvalidUnit,        ///< A unit has an empty identifier or root.
    SelfDependency,     ///< A unit lists itself as a dependency.
    Cycle,              ///< Units that are part of a dependency cycle.
    NestedRoot          ///< A unit root lies inside another unit's root.
};

const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Units involved in this issue, in construction order.
    std::vector<UnitId> involved_units;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while building a UnitGraph.
 *
 * @details
 * `GraphDiagnostics` is produced once by `UnitGraph::build()`.
 *
 * @par Error vs Warning
 * - **Errors** make `build()` throw `GraphError`; the diagnostics are then
 *   reachable through `GraphError::diagnostics()`.
 *   Examples: UnknownDependency, DuplicateUnit, InvalidUnit.
 * - **Warnings** describe malformed but survivable data. The graph is built
 *   and every query still terminates.
 *   Examples: Cycle, SelfDependency, NestedRoot.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Check whether any item (error or warning) has the given category.
     */
    bool has_category(DiagnosticCategory category) const noexcept
    {
        auto matches = [category](const DiagnosticItem& item) {
            return item.category == category;
        };
        return std::any_of(m_errors.begin(), m_errors.end(), matches) ||
               std::any_of(m_warnings.begin(), m_warnings.end(), matches);
    }

    // Allow UnitGraph to populate diagnostics
    friend class UnitGraph;

private:
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace deltatest
