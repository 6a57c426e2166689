/**
 * @file vcs_provider.hpp
 * @brief IVcsProvider interface: where changed-file lists come from.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/resolve/change_resolver.hpp"

namespace deltatest
{

/**
 * @brief Interface for version-control diff providers.
 *
 * @details
 * Returned paths are absolute and normalized, rooted at the repository
 * working tree. All methods throw `DiffError` when the changed-file list
 * cannot be produced.
 */
class IVcsProvider
{
public:
    virtual ~IVcsProvider() = default;

    /**
     * @brief Find the working-tree root of the repository containing `start`.
     * @throw DiffError with `RepositoryNotFound` if `start` is not inside a
     *        repository.
     */
    virtual std::filesystem::path workspace_root(const std::filesystem::path& start) = 0;

    /**
     * @brief Staged, unstaged and untracked changes of the working tree.
     */
    virtual std::vector<ChangedFile> uncommitted_changes(const std::filesystem::path& repo_root) = 0;

    /**
     * @brief Files changed between two references.
     * @param repo_root Working-tree root.
     * @param from Starting reference.
     * @param to Ending reference, usually "HEAD".
     * @throw DiffError with `InvalidReference` if a reference does not name a
     *        commit.
     */
    virtual std::vector<ChangedFile> changes_between(const std::filesystem::path& repo_root,
                                                     const std::string& from,
                                                     const std::string& to) = 0;
};

} // namespace deltatest
