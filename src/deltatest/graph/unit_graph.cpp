/**
 * @file unit_graph.cpp
 */
#include "deltatest/graph/unit_graph.hpp"

#include "deltatest/common/log.hpp"
#include "deltatest/common/path_utils.hpp"

#include <queue>
#include <sstream>

namespace deltatest
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::UnknownDependency:
        return "unknown_dependency";
    case DiagnosticCategory::DuplicateUnit:
        return "duplicate_unit";
    case DiagnosticCategory::InvalidUnit:
        return "invalid_unit";
    case DiagnosticCategory::SelfDependency:
        return "self_dependency";
    case DiagnosticCategory::Cycle:
        return "cycle";
    case DiagnosticCategory::NestedRoot:
        return "nested_root";
    }
    return "unknown";
}

namespace
{

GraphErrorCode error_code_for(DiagnosticCategory category)
{
    switch (category)
    {
    case DiagnosticCategory::UnknownDependency:
        return GraphErrorCode::UnknownDependency;
    case DiagnosticCategory::DuplicateUnit:
        return GraphErrorCode::DuplicateUnit;
    default:
        return GraphErrorCode::InvalidUnit;
    }
}

std::string join_ids(const std::vector<UnitId>& ids)
{
    std::string joined;
    for (const auto& id : ids)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += id;
    }
    return joined;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

UnitGraph UnitGraph::build(std::vector<Unit> units)
{
    auto diagnostics = std::make_shared<GraphDiagnostics>();

    for (auto& unit : units)
    {
        unit.root = normalize_path(unit.root);
    }

    validate_units(units, *diagnostics);

    if (diagnostics->has_errors())
    {
        const auto& errors = diagnostics->errors();
        std::ostringstream oss;
        oss << "Invalid workspace graph (" << errors.size() << " error"
            << (errors.size() == 1 ? "" : "s") << "):";
        for (const auto& item : errors)
        {
            oss << "\n  - " << item.message;
        }
        GraphErrorCode code = error_code_for(errors.front().category);
        throw GraphError(code, oss.str(), std::move(diagnostics));
    }

    UnitGraph graph;
    graph.m_units = std::move(units);
    for (size_t pos = 0; pos < graph.m_units.size(); ++pos)
    {
        graph.m_positions.emplace(graph.m_units[pos].id, pos);
    }
    graph.index_dependents();
    graph.detect_cycles(*diagnostics);
    graph.detect_nested_roots(*diagnostics);

    for (const auto& item : diagnostics->warnings())
    {
        DELTATEST_LOG_WARN("graph", item.message);
    }
    DELTATEST_LOG_DEBUG("graph", "built graph with " << graph.m_units.size() << " units");

    graph.m_diagnostics = std::move(diagnostics);
    return graph;
}

void UnitGraph::validate_units(const std::vector<Unit>& units, GraphDiagnostics& diagnostics)
{
    // Phase 1: identifiers and roots
    std::unordered_set<UnitId> seen;
    std::unordered_set<UnitId> reported_duplicates;
    for (const auto& unit : units)
    {
        if (unit.id.empty())
        {
            diagnostics.add({DiagnosticSeverity::Error,
                             DiagnosticCategory::InvalidUnit,
                             "Unit '" + unit.name + "' has an empty identifier",
                             {}});
            continue;
        }
        if (!unit.root.is_absolute())
        {
            diagnostics.add({DiagnosticSeverity::Error,
                             DiagnosticCategory::InvalidUnit,
                             "Unit '" + unit.id + "' has a root that is not an absolute path: '" +
                                 unit.root.generic_string() + "'",
                             {unit.id}});
        }
        if (!seen.insert(unit.id).second && reported_duplicates.insert(unit.id).second)
        {
            diagnostics.add({DiagnosticSeverity::Error,
                             DiagnosticCategory::DuplicateUnit,
                             "Unit identifier '" + unit.id + "' is used more than once",
                             {unit.id}});
        }
    }

    // Phase 2: dependency edges
    for (const auto& unit : units)
    {
        for (const auto& dep : unit.dependencies)
        {
            if (seen.count(dep) == 0)
            {
                diagnostics.add({DiagnosticSeverity::Error,
                                 DiagnosticCategory::UnknownDependency,
                                 "Unit '" + unit.id + "' depends on unknown unit '" + dep + "'",
                                 {unit.id}});
            }
            else if (dep == unit.id)
            {
                diagnostics.add({DiagnosticSeverity::Warning,
                                 DiagnosticCategory::SelfDependency,
                                 "Unit '" + unit.id + "' lists itself as a dependency",
                                 {unit.id}});
            }
        }
    }
}

void UnitGraph::index_dependents()
{
    for (const auto& unit : m_units)
    {
        m_dependents[unit.id];
    }
    for (const auto& unit : m_units)
    {
        for (const auto& dep : unit.dependencies)
        {
            m_dependents[dep].insert(unit.id);
        }
    }
}

void UnitGraph::detect_cycles(GraphDiagnostics& diagnostics) const
{
    const size_t count = m_units.size();
    if (count == 0)
    {
        return;
    }

    // Edges run from a dependency to its dependent; self edges are reported
    // separately and are left out here.
    std::vector<std::vector<size_t>> successors(count);
    std::vector<size_t> in_degree(count, 0);
    std::vector<size_t> out_degree(count, 0);
    for (size_t pos = 0; pos < count; ++pos)
    {
        const UnitId& id = m_units[pos].id;
        for (const auto& dependent : m_dependents.at(id))
        {
            size_t succ = m_positions.at(dependent);
            if (succ == pos)
            {
                continue;
            }
            successors[pos].push_back(succ);
            ++in_degree[succ];
            ++out_degree[pos];
        }
    }

    // Kahn's algorithm: peel off units with no remaining dependencies.
    std::vector<bool> removed(count, false);
    std::queue<size_t> ready;
    for (size_t pos = 0; pos < count; ++pos)
    {
        if (in_degree[pos] == 0)
        {
            ready.push(pos);
        }
    }
    size_t processed = 0;
    while (!ready.empty())
    {
        size_t pos = ready.front();
        ready.pop();
        removed[pos] = true;
        ++processed;
        for (size_t succ : successors[pos])
        {
            if (--in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }
    if (processed == count)
    {
        return;
    }

    // Kahn leaves behind units downstream of a cycle as well; peel those off
    // from the other end so that only units on a cycle remain.
    std::vector<std::vector<size_t>> predecessors(count);
    for (size_t pos = 0; pos < count; ++pos)
    {
        out_degree[pos] = 0;
    }
    for (size_t pos = 0; pos < count; ++pos)
    {
        if (removed[pos])
        {
            continue;
        }
        for (size_t succ : successors[pos])
        {
            if (!removed[succ])
            {
                predecessors[succ].push_back(pos);
                ++out_degree[pos];
            }
        }
    }
    for (size_t pos = 0; pos < count; ++pos)
    {
        if (!removed[pos] && out_degree[pos] == 0)
        {
            ready.push(pos);
        }
    }
    while (!ready.empty())
    {
        size_t pos = ready.front();
        ready.pop();
        removed[pos] = true;
        for (size_t pred : predecessors[pos])
        {
            if (--out_degree[pred] == 0)
            {
                ready.push(pred);
            }
        }
    }

    DiagnosticItem item;
    item.severity = DiagnosticSeverity::Warning;
    item.category = DiagnosticCategory::Cycle;
    for (size_t pos = 0; pos < count; ++pos)
    {
        if (!removed[pos])
        {
            item.involved_units.push_back(m_units[pos].id);
        }
    }
    item.message = "Dependency cycle among units: " + join_ids(item.involved_units);
    diagnostics.add(std::move(item));
}

void UnitGraph::detect_nested_roots(GraphDiagnostics& diagnostics) const
{
    for (const auto& inner : m_units)
    {
        for (const auto& outer : m_units)
        {
            if (&inner == &outer || !path_is_within(inner.root, outer.root))
            {
                continue;
            }
            // Equal roots are reported once, from the later unit.
            if (inner.root == outer.root && m_positions.at(inner.id) < m_positions.at(outer.id))
            {
                continue;
            }
            diagnostics.add({DiagnosticSeverity::Warning,
                             DiagnosticCategory::NestedRoot,
                             "Root of unit '" + inner.id + "' (" + inner.root.generic_string() +
                                 ") lies inside the root of unit '" + outer.id + "'",
                             {outer.id, inner.id}});
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

bool UnitGraph::contains(const UnitId& id) const
{
    return m_positions.count(id) != 0;
}

const Unit* UnitGraph::find(const UnitId& id) const
{
    auto it = m_positions.find(id);
    if (it == m_positions.end())
    {
        return nullptr;
    }
    return &m_units[it->second];
}

const Unit& UnitGraph::at(const UnitId& id) const
{
    const Unit* unit = find(id);
    if (unit == nullptr)
    {
        throw GraphError(GraphErrorCode::UnknownUnit, "Unknown unit '" + id + "'");
    }
    return *unit;
}

std::optional<UnitId> UnitGraph::unit_containing(const std::filesystem::path& path) const
{
    fs::path normalized = normalize_path(path);
    if (!normalized.is_absolute())
    {
        return std::nullopt;
    }

    const Unit* best = nullptr;
    size_t best_depth = 0;
    for (const auto& unit : m_units)
    {
        if (!path_is_within(normalized, unit.root))
        {
            continue;
        }
        size_t depth = path_depth(unit.root);
        if (best == nullptr || depth > best_depth)
        {
            best = &unit;
            best_depth = depth;
        }
    }
    if (best == nullptr)
    {
        return std::nullopt;
    }
    return best->id;
}

const UnitIdSet& UnitGraph::dependents_of(const UnitId& id) const
{
    auto it = m_dependents.find(id);
    if (it == m_dependents.end())
    {
        throw GraphError(GraphErrorCode::UnknownUnit, "Unknown unit '" + id + "'");
    }
    return it->second;
}

UnitIdSet UnitGraph::transitive_dependents_of(const UnitIdSet& initial) const
{
    UnitIdSet visited;
    std::queue<UnitId> pending;
    for (const auto& id : initial)
    {
        if (!contains(id))
        {
            throw GraphError(GraphErrorCode::UnknownUnit, "Unknown unit '" + id + "'");
        }
        if (visited.insert(id).second)
        {
            pending.push(id);
        }
    }

    while (!pending.empty())
    {
        UnitId current = std::move(pending.front());
        pending.pop();
        for (const auto& dependent : m_dependents.at(current))
        {
            if (visited.insert(dependent).second)
            {
                pending.push(dependent);
            }
        }
    }
    return visited;
}

} // namespace deltatest
