/**
 * @file test_invoker.hpp
 * @brief Run the external test command for one unit.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/unit_types.hpp"
#include "deltatest/graph/unit.hpp"

namespace deltatest
{

/**
 * @brief Per-invocation options.
 */
struct InvokeOptions
{
    /// Receives output chunks live while the command runs (verbose mode).
    /// Output is captured either way.
    std::function<void(const std::string&)> on_output;
};

/**
 * @brief Result of a test command that was started.
 */
struct InvocationResult
{
    /// Exit status; any nonzero value (including 128 + signal) is a failure.
    int exit_code = -1;

    /// Combined stdout and stderr.
    std::string output;

    std::chrono::milliseconds duration{0};
};

/**
 * @brief Interface for running the test command of a unit.
 *
 * @details
 * Implementations run synchronously. A command that starts and exits
 * nonzero is a normal result; a command that cannot be started at all
 * throws `InvocationError`.
 */
class ITestInvoker
{
public:
    virtual ~ITestInvoker() = default;

    /**
     * @brief Run the test command for `unit`.
     * @param unit The unit to test.
     * @param args Passthrough arguments, appended verbatim.
     * @param options Live output options.
     * @throw InvocationError if the command cannot be started.
     */
    virtual InvocationResult invoke(const Unit& unit,
                                    const std::vector<std::string>& args,
                                    const InvokeOptions& options) = 0;

    /**
     * @brief Short name of the tool, used in reports ("cargo", "nextest").
     */
    virtual std::string tool_name() const = 0;
};

/**
 * @brief Runs `cargo test` or `cargo nextest run` for one package.
 *
 * @details
 * Both tools share one contract; the `TestTool` tag only selects the
 * command line:
 * - `Cargo`: `cargo test -p <name> <args...>`
 * - `Nextest`: `cargo nextest run --no-tests pass -p <name> <args...>`
 *
 * Commands run with the workspace root as working directory.
 */
class CommandTestInvoker : public ITestInvoker
{
public:
    CommandTestInvoker(TestTool tool, std::filesystem::path workspace_root);

    TestTool tool() const noexcept
    {
        return m_tool;
    }

    /**
     * @brief The full argument vector that `invoke()` runs for `unit`.
     */
    std::vector<std::string> command_line(const Unit& unit,
                                          const std::vector<std::string>& args) const;

    InvocationResult invoke(const Unit& unit,
                            const std::vector<std::string>& args,
                            const InvokeOptions& options) override;

    std::string tool_name() const override;

    /**
     * @brief Check that the tool can be run (`cargo --version` or
     *        `cargo nextest --version`).
     */
    bool is_available() const;

    /**
     * @brief How to install the tool when `is_available()` is false.
     */
    std::string installation_tip() const;

private:
    TestTool m_tool;
    std::filesystem::path m_workspace_root;
};

} // namespace deltatest
