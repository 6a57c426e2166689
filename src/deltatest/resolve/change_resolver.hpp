/**
 * @file change_resolver.hpp
 * @brief Map changed file paths to the units that own them.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"
#include "deltatest/graph/unit_graph.hpp"

namespace deltatest
{

/**
 * @brief One entry of a changed-file list.
 *
 * @details
 * For a rename, `path` is the new location and `old_path` the previous one;
 * both belong to the change.
 */
struct ChangedFile
{
    std::filesystem::path path;
    std::optional<std::filesystem::path> old_path;
    ChangeKind kind = ChangeKind::Modified;
};

/**
 * @brief Find the units whose root contains at least one changed path.
 *
 * @param changed_paths Changed file paths. Relative paths are resolved
 *        against `workspace_root` when it is given.
 * @param graph The unit graph.
 * @param workspace_root Base for relative paths; may be empty.
 * @return The directly changed units. Paths that no unit claims are ignored,
 *         so an empty result means "nothing to test".
 */
UnitIdSet resolve(const std::vector<std::filesystem::path>& changed_paths,
                  const UnitGraph& graph,
                  const std::filesystem::path& workspace_root = {});

/**
 * @brief Same as above, over `ChangedFile` entries.
 *
 * @details
 * Both the current and the previous path of an entry are resolved, so moving
 * a file out of a unit still marks that unit as changed.
 */
UnitIdSet resolve(const std::vector<ChangedFile>& changed_files,
                  const UnitGraph& graph,
                  const std::filesystem::path& workspace_root = {});

} // namespace deltatest
