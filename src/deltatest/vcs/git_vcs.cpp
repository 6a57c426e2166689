/**
 * @file git_vcs.cpp
 */
#include "deltatest/vcs/git_vcs.hpp"

#include "deltatest/common/log.hpp"
#include "deltatest/common/path_utils.hpp"
#include "deltatest/execution/process_runner.hpp"

namespace deltatest
{

// ============================================================================
// Output parsers
// ============================================================================

namespace
{

/// Split NUL-terminated records; a trailing terminator does not yield an
/// empty field.
std::vector<std::string> split_nul(const std::string& output)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (start < output.size())
    {
        size_t end = output.find('\0', start);
        if (end == std::string::npos)
        {
            end = output.size();
        }
        fields.push_back(output.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

std::string trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

[[noreturn]] void malformed(const std::string& what, const std::string& entry)
{
    throw DiffError(DiffErrorCode::MalformedOutput,
                    "Unexpected " + what + " entry from git: '" + entry + "'");
}

} // namespace

std::vector<ChangedFile> parse_porcelain_status(const std::string& output)
{
    std::vector<ChangedFile> changes;
    auto fields = split_nul(output);
    for (size_t i = 0; i < fields.size(); ++i)
    {
        const std::string& entry = fields[i];
        if (entry.size() < 4 || entry[2] != ' ')
        {
            malformed("status", entry);
        }
        char index = entry[0];
        char worktree = entry[1];
        if (index == '!')
        {
            continue;
        }

        ChangedFile change;
        change.path = entry.substr(3);
        if (index == '?' || index == 'A' || index == 'C')
        {
            change.kind = ChangeKind::Added;
        }
        else if (index == 'D' || worktree == 'D')
        {
            change.kind = ChangeKind::Removed;
        }
        else
        {
            change.kind = ChangeKind::Modified;
        }

        // Renames and copies are followed by the source path.
        if (index == 'R' || index == 'C' || worktree == 'R' || worktree == 'C')
        {
            if (i + 1 >= fields.size())
            {
                malformed("status", entry);
            }
            std::string source = fields[++i];
            if (index == 'R' || worktree == 'R')
            {
                change.old_path = std::filesystem::path(source);
            }
        }
        changes.push_back(std::move(change));
    }
    return changes;
}

std::vector<ChangedFile> parse_name_status(const std::string& output)
{
    std::vector<ChangedFile> changes;
    auto fields = split_nul(output);
    for (size_t i = 0; i < fields.size(); ++i)
    {
        const std::string& status = fields[i];
        if (status.empty())
        {
            malformed("name-status", status);
        }

        ChangedFile change;
        char letter = status[0];
        if (letter == 'R' || letter == 'C')
        {
            if (i + 2 >= fields.size())
            {
                malformed("name-status", status);
            }
            std::string source = fields[++i];
            change.path = fields[++i];
            if (letter == 'R')
            {
                change.kind = ChangeKind::Modified;
                change.old_path = std::filesystem::path(source);
            }
            else
            {
                change.kind = ChangeKind::Added;
            }
        }
        else
        {
            if (i + 1 >= fields.size())
            {
                malformed("name-status", status);
            }
            change.path = fields[++i];
            switch (letter)
            {
            case 'A':
                change.kind = ChangeKind::Added;
                break;
            case 'D':
                change.kind = ChangeKind::Removed;
                break;
            case 'M':
            case 'T':
            case 'U':
            case 'X':
            case 'B':
                change.kind = ChangeKind::Modified;
                break;
            default:
                malformed("name-status", status);
            }
        }
        changes.push_back(std::move(change));
    }
    return changes;
}

// ============================================================================
// GitVcs
// ============================================================================

namespace
{

std::vector<ChangedFile> anchor(std::vector<ChangedFile> changes, const fs::path& repo_root)
{
    for (auto& change : changes)
    {
        change.path = normalize_path(change.path, repo_root);
        if (change.old_path)
        {
            change.old_path = normalize_path(*change.old_path, repo_root);
        }
    }
    return changes;
}

} // namespace

std::string GitVcs::run_git(const std::vector<std::string>& args, DiffErrorCode code) const
{
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions options;
    options.merge_stderr = false;

    ProcessResult result;
    try
    {
        result = run_process(argv, options);
    }
    catch (const InvocationError& e)
    {
        throw DiffError(DiffErrorCode::CommandFailed, std::string("Failed to run git: ") + e.what());
    }

    if (!result.success())
    {
        std::string detail = trim(result.error_output);
        throw DiffError(code, format_command_line(argv) + " failed with exit code " +
                                  std::to_string(result.exit_code) +
                                  (detail.empty() ? "" : ": " + detail));
    }
    return result.output;
}

fs::path GitVcs::workspace_root(const fs::path& start)
{
    std::string output = run_git({"-C", start.string(), "rev-parse", "--show-toplevel"},
                                 DiffErrorCode::RepositoryNotFound);
    std::string root = trim(output);
    if (root.empty())
    {
        throw DiffError(DiffErrorCode::RepositoryNotFound,
                        "Repository at '" + start.string() + "' has no working tree");
    }
    DELTATEST_LOG_DEBUG("vcs", "repository root: " << root);
    return normalize_path(root);
}

std::vector<ChangedFile> GitVcs::uncommitted_changes(const fs::path& repo_root)
{
    std::string output = run_git({"-C", repo_root.string(), "status", "--porcelain=v1", "-z",
                                  "--untracked-files=all"},
                                 DiffErrorCode::CommandFailed);
    auto changes = anchor(parse_porcelain_status(output), repo_root);
    DELTATEST_LOG_DEBUG("vcs", changes.size() << " uncommitted changes");
    return changes;
}

std::vector<ChangedFile> GitVcs::changes_between(const fs::path& repo_root,
                                                 const std::string& from,
                                                 const std::string& to)
{
    verify_reference(repo_root, from);
    verify_reference(repo_root, to);

    std::string output = run_git({"-C", repo_root.string(), "diff", "--name-status", "-z", "-M",
                                  from, to, "--"},
                                 DiffErrorCode::CommandFailed);
    auto changes = anchor(parse_name_status(output), repo_root);
    DELTATEST_LOG_DEBUG("vcs", changes.size() << " changes between " << from << " and " << to);
    return changes;
}

void GitVcs::verify_reference(const fs::path& repo_root, const std::string& ref) const
{
    if (ref.empty() || ref.front() == '-')
    {
        throw DiffError(DiffErrorCode::InvalidReference, "Invalid reference '" + ref + "'");
    }
    try
    {
        run_git({"-C", repo_root.string(), "rev-parse", "--verify", "--quiet", ref + "^{commit}"},
                DiffErrorCode::InvalidReference);
    }
    catch (const DiffError& e)
    {
        if (e.code() != DiffErrorCode::InvalidReference)
        {
            throw;
        }
        throw DiffError(DiffErrorCode::InvalidReference,
                        "Reference '" + ref + "' does not name a commit");
    }
}

} // namespace deltatest
