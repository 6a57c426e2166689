#include "deltatest/common/unit_types.hpp"

namespace deltatest
{

const char* to_string(UnitStatus status) noexcept
{
    switch (status)
    {
    case UnitStatus::Passed:
        return "passed";
    case UnitStatus::Failed:
        return "failed";
    case UnitStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

const char* to_string(RunStatus status) noexcept
{
    switch (status)
    {
    case RunStatus::Success:
        return "success";
    case RunStatus::Failure:
        return "failure";
    }
    return "unknown";
}

const char* to_string(AffectedOrigin origin) noexcept
{
    switch (origin)
    {
    case AffectedOrigin::ChangeDetection:
        return "change_detection";
    case AffectedOrigin::Override:
        return "override";
    }
    return "unknown";
}

const char* to_string(ChangeKind kind) noexcept
{
    switch (kind)
    {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Removed:
        return "removed";
    }
    return "unknown";
}

const char* to_string(TestTool tool) noexcept
{
    switch (tool)
    {
    case TestTool::Cargo:
        return "cargo";
    case TestTool::Nextest:
        return "nextest";
    }
    return "unknown";
}

std::optional<TestTool> parse_test_tool(const std::string& name)
{
    if (name == "cargo")
    {
        return TestTool::Cargo;
    }
    if (name == "nextest")
    {
        return TestTool::Nextest;
    }
    return std::nullopt;
}

} // namespace deltatest
