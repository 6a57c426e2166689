#include "deltatest/common/path_utils.hpp"

namespace deltatest
{

fs::path normalize_path(const fs::path& path)
{
    if (path.empty())
    {
        return path;
    }

    // Windows-style separators from external tools are folded into '/'
    std::string generic = path.generic_string();
    std::replace(generic.begin(), generic.end(), '\\', '/');

    // lexically_normal() keeps a trailing separator as an empty last element
    std::string text = fs::path(generic).lexically_normal().generic_string();
    while (text.size() > 1 && text.back() == '/')
    {
        text.pop_back();
    }
    return fs::path(text);
}

fs::path normalize_path(const fs::path& path, const fs::path& base)
{
    if (path.is_relative() && !base.empty())
    {
        return normalize_path(base / path);
    }
    return normalize_path(path);
}

bool path_is_within(const fs::path& path, const fs::path& root)
{
    if (root.empty())
    {
        return false;
    }

    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it)
    {
        if (path_it == path.end() || *path_it != *root_it)
        {
            return false;
        }
    }
    return true;
}

size_t path_depth(const fs::path& path)
{
    return static_cast<size_t>(std::distance(path.begin(), path.end()));
}

} // namespace deltatest
