/**
 * @file test_invoker_tests.cpp
 */
#include <gtest/gtest.h>
#include "deltatest/execution/test_invoker.hpp"

using namespace deltatest;

namespace
{

Unit make_unit()
{
    return Unit{"my-crate", "my-crate", "/ws/crates/my-crate", {}};
}

} // namespace

TEST(TestInvokerTests, CommandLine_Cargo)
{
    CommandTestInvoker invoker(TestTool::Cargo, "/ws");
    EXPECT_EQ(invoker.command_line(make_unit(), {}),
              (std::vector<std::string>{"cargo", "test", "-p", "my-crate"}));
    EXPECT_EQ(invoker.tool_name(), "cargo");
}

TEST(TestInvokerTests, CommandLine_Nextest)
{
    CommandTestInvoker invoker(TestTool::Nextest, "/ws");
    EXPECT_EQ(invoker.command_line(make_unit(), {}),
              (std::vector<std::string>{"cargo", "nextest", "run", "--no-tests", "pass", "-p",
                                        "my-crate"}));
    EXPECT_EQ(invoker.tool_name(), "nextest");
}

TEST(TestInvokerTests, CommandLine_AppendsArgsVerbatim)
{
    CommandTestInvoker invoker(TestTool::Cargo, "/ws");
    std::vector<std::string> args{"--release", "--", "--test-threads=1"};
    EXPECT_EQ(invoker.command_line(make_unit(), args),
              (std::vector<std::string>{"cargo", "test", "-p", "my-crate", "--release", "--",
                                        "--test-threads=1"}));
}

TEST(TestInvokerTests, InstallationTip_MentionsTool)
{
    CommandTestInvoker nextest(TestTool::Nextest, "/ws");
    EXPECT_NE(nextest.installation_tip().find("cargo install cargo-nextest"), std::string::npos);

    CommandTestInvoker cargo(TestTool::Cargo, "/ws");
    EXPECT_FALSE(cargo.installation_tip().empty());
}
