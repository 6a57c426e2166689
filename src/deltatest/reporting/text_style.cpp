#include "deltatest/reporting/text_style.hpp"

#include <cstdlib>
#include <unistd.h>

namespace deltatest
{

std::optional<ColorMode> parse_color_mode(const std::string& name)
{
    if (name == "auto")
        return ColorMode::Auto;
    if (name == "always")
        return ColorMode::Always;
    if (name == "never")
        return ColorMode::Never;
    return std::nullopt;
}

bool should_use_color(ColorMode mode, int fd)
{
    switch (mode)
    {
    case ColorMode::Always:
        return true;
    case ColorMode::Never:
        return false;
    case ColorMode::Auto:
        break;
    }
    if (std::getenv("NO_COLOR") != nullptr)
    {
        return false;
    }
    return ::isatty(fd) != 0;
}

} // namespace deltatest
