/**
 * @file change_resolver.cpp
 */
#include "deltatest/resolve/change_resolver.hpp"

#include "deltatest/common/log.hpp"
#include "deltatest/common/path_utils.hpp"

namespace deltatest
{

namespace
{

void resolve_one(const fs::path& path,
                 const UnitGraph& graph,
                 const fs::path& workspace_root,
                 UnitIdSet& result)
{
    fs::path normalized = normalize_path(path, workspace_root);
    auto owner = graph.unit_containing(normalized);
    if (owner)
    {
        DELTATEST_LOG_TRACE("resolve", normalized.generic_string() << " -> " << *owner);
        result.insert(*owner);
    }
    else
    {
        DELTATEST_LOG_DEBUG("resolve", "no unit contains " << normalized.generic_string());
    }
}

} // namespace

UnitIdSet resolve(const std::vector<fs::path>& changed_paths,
                  const UnitGraph& graph,
                  const fs::path& workspace_root)
{
    UnitIdSet result;
    for (const auto& path : changed_paths)
    {
        resolve_one(path, graph, workspace_root, result);
    }
    return result;
}

UnitIdSet resolve(const std::vector<ChangedFile>& changed_files,
                  const UnitGraph& graph,
                  const fs::path& workspace_root)
{
    UnitIdSet result;
    for (const auto& file : changed_files)
    {
        resolve_one(file.path, graph, workspace_root, result);
        if (file.old_path)
        {
            resolve_one(*file.old_path, graph, workspace_root, result);
        }
    }
    DELTATEST_LOG_DEBUG("resolve", changed_files.size() << " changed files touch "
                                                          << result.size() << " units");
    return result;
}

} // namespace deltatest
