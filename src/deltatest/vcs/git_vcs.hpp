/**
 * @file git_vcs.hpp
 * @brief Git implementation of IVcsProvider, driving the `git` command.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/errors.hpp"
#include "deltatest/vcs/vcs_provider.hpp"

namespace deltatest
{

/**
 * @brief Parse `git status --porcelain=v1 -z` output.
 *
 * @details
 * Paths are returned as git prints them, relative to the repository root.
 * Untracked files are `Added`; renames and copies carry the source path in
 * `old_path`; ignored entries (`!!`) are dropped.
 *
 * @throw DiffError with `MalformedOutput` on an entry that cannot be parsed.
 */
std::vector<ChangedFile> parse_porcelain_status(const std::string& output);

/**
 * @brief Parse `git diff --name-status -z` output.
 *
 * @details
 * Same conventions as `parse_porcelain_status()`.
 *
 * @throw DiffError with `MalformedOutput` on an entry that cannot be parsed.
 */
std::vector<ChangedFile> parse_name_status(const std::string& output);

/**
 * @brief IVcsProvider backed by the `git` executable found on PATH.
 */
class GitVcs : public IVcsProvider
{
public:
    std::filesystem::path workspace_root(const std::filesystem::path& start) override;

    std::vector<ChangedFile> uncommitted_changes(const std::filesystem::path& repo_root) override;

    std::vector<ChangedFile> changes_between(const std::filesystem::path& repo_root,
                                             const std::string& from,
                                             const std::string& to) override;

private:
    /// Run git, returning stdout; nonzero exit throws DiffError with `code`.
    std::string run_git(const std::vector<std::string>& args, DiffErrorCode code) const;

    void verify_reference(const std::filesystem::path& repo_root, const std::string& ref) const;
};

} // namespace deltatest
