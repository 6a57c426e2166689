/**
 * @file affected_set.cpp
 */
#include "deltatest/resolve/affected_set.hpp"

#include "deltatest/common/log.hpp"

namespace deltatest
{

std::vector<UnitId> AffectedSet::ids() const
{
    std::vector<UnitId> result;
    result.reserve(entries.size());
    for (const auto& entry : entries)
    {
        result.push_back(entry.id);
    }
    return result;
}

size_t AffectedSet::direct_count() const noexcept
{
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [](const AffectedEntry& e) { return e.direct; }));
}

namespace
{

void sort_entries(std::vector<AffectedEntry>& entries, const UnitGraph& graph)
{
    std::sort(entries.begin(), entries.end(),
              [&graph](const AffectedEntry& lhs, const AffectedEntry& rhs) {
                  const std::string& lhs_name = graph.at(lhs.id).name;
                  const std::string& rhs_name = graph.at(rhs.id).name;
                  if (lhs_name != rhs_name)
                  {
                      return lhs_name < rhs_name;
                  }
                  return lhs.id < rhs.id;
              });
}

} // namespace

AffectedSet expand(const UnitIdSet& direct, const UnitGraph& graph, bool include_dependents)
{
    AffectedSet result;
    result.origin = AffectedOrigin::ChangeDetection;

    UnitIdSet selected = include_dependents ? graph.transitive_dependents_of(direct) : direct;
    for (const auto& id : selected)
    {
        // at() rejects unknown identifiers when expansion was skipped
        graph.at(id);
        result.entries.push_back({id, direct.count(id) != 0});
    }
    sort_entries(result.entries, graph);

    DELTATEST_LOG_DEBUG("resolve", "affected set: " << result.direct_count() << " changed, "
                                                     << result.dependent_count() << " dependent");
    return result;
}

AffectedSet from_override(const std::vector<UnitId>& ids, const UnitGraph& graph)
{
    std::vector<UnitId> unknown;
    UnitIdSet seen;
    AffectedSet result;
    result.origin = AffectedOrigin::Override;

    for (const auto& id : ids)
    {
        if (!seen.insert(id).second)
        {
            continue;
        }
        if (!graph.contains(id))
        {
            unknown.push_back(id);
            continue;
        }
        result.entries.push_back({id, true});
    }

    if (!unknown.empty())
    {
        std::string message = unknown.size() == 1 ? "Unknown unit in override list: "
                                                  : "Unknown units in override list: ";
        for (size_t i = 0; i < unknown.size(); ++i)
        {
            message += (i == 0 ? "'" : ", '") + unknown[i] + "'";
        }
        throw GraphError(GraphErrorCode::UnknownDependency, message);
    }

    sort_entries(result.entries, graph);
    return result;
}

} // namespace deltatest
