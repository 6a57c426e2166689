/**
 * @file text_style.hpp
 * @brief ANSI emphasis for human-readable output.
 */
#pragma once
#include "deltatest/common/common.hpp"

namespace deltatest
{

enum class ColorMode
{
    Auto,
    Always,
    Never
};

std::optional<ColorMode> parse_color_mode(const std::string& name);

/**
 * @brief Decide whether to color output written to `fd`.
 *
 * @details
 * `Auto` colors only when `fd` is a terminal and `NO_COLOR` is unset.
 */
bool should_use_color(ColorMode mode, int fd);

/**
 * @brief Wraps text in ANSI escapes when enabled, passes it through otherwise.
 */
class TextStyle
{
public:
    explicit TextStyle(bool enabled = false)
        : m_enabled(enabled)
    {
    }

    bool enabled() const noexcept
    {
        return m_enabled;
    }

    std::string green(const std::string& text) const
    {
        return wrap("\033[1;32m", text);
    }

    std::string red(const std::string& text) const
    {
        return wrap("\033[1;31m", text);
    }

    std::string yellow(const std::string& text) const
    {
        return wrap("\033[1;33m", text);
    }

    std::string cyan(const std::string& text) const
    {
        return wrap("\033[1;36m", text);
    }

    std::string bold(const std::string& text) const
    {
        return wrap("\033[1m", text);
    }

private:
    std::string wrap(const char* code, const std::string& text) const
    {
        return m_enabled ? code + text + "\033[0m" : text;
    }

    bool m_enabled;
};

} // namespace deltatest
