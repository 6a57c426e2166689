/**
 * @file path_utils.hpp
 * @brief Path normalization and containment checks shared by the resolver
 *        and the workspace adapters.
 */
#pragma once
#include "deltatest/common/common.hpp"

namespace deltatest
{

namespace fs = std::filesystem;

/**
 * @brief Lexically normalize a path.
 *
 * @details
 * Folds `.` and `..`, converts every separator (including `\`) to `/` and
 * drops a trailing separator. Does not touch the filesystem, so paths of deleted
 * files normalize the same way as existing ones.
 */
fs::path normalize_path(const fs::path& path);

/**
 * @brief Normalize `path`, resolving it against `base` first if relative.
 */
fs::path normalize_path(const fs::path& path, const fs::path& base);

/**
 * @brief Check whether `path` is `root` or lies below it.
 *
 * @details
 * Both arguments are expected to be normalized. The comparison is done
 * component by component, so `/ws/foo` does not contain `/ws/foobar/x`.
 */
bool path_is_within(const fs::path& path, const fs::path& root);

/**
 * @brief Number of components in a normalized path.
 */
size_t path_depth(const fs::path& path);

} // namespace deltatest
