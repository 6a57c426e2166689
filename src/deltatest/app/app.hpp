/**
 * @file app.hpp
 * @brief The end-to-end pipeline behind the command-line tool.
 */
#pragma once
#include "deltatest/cli/cli_options.hpp"
#include "deltatest/common/common.hpp"
#include "deltatest/common/errors.hpp"
#include "deltatest/execution/test_invoker.hpp"
#include "deltatest/reporting/reporter.hpp"
#include "deltatest/vcs/vcs_provider.hpp"
#include "deltatest/workspace/workspace_provider.hpp"

namespace deltatest
{

/**
 * @brief Checks that the test tool can run before a real run.
 * @return An installation tip if the tool is unavailable, `std::nullopt`
 *         if it is ready.
 */
using RunnerPreflight = std::function<std::optional<std::string>()>;

/**
 * @brief Runs one invocation: discover, resolve, expand, test, report.
 *
 * @details
 * Every external collaborator is injected, so the pipeline runs the same
 * against Git and Cargo as against in-memory fakes.
 *
 * Steps:
 * 1. find the repository root from `RunConfig::start_directory`;
 * 2. load the units and build the graph (warnings are logged);
 * 3. select units: the override list if given, otherwise the changed files
 *    (uncommitted, or `from..to`) resolved to units and expanded to
 *    dependents unless `skip_dependents` is set;
 * 4. report an empty selection and stop, or report the plan;
 * 5. run the orchestrator with the reporter as listener and report the
 *    result.
 *
 * Fatal errors are reported through `IReporter::error()` and turned into
 * the matching exit code; nothing escapes `run()`.
 */
class App
{
public:
    App(IVcsProvider& vcs,
        IWorkspaceProvider& workspace,
        ITestInvoker& invoker,
        IReporter& reporter,
        RunnerPreflight preflight = nullptr);

    ExitCode run(const RunConfig& config);

private:
    ExitCode run_pipeline(const RunConfig& config);

    AffectedSet select_units(const RunConfig& config,
                             const std::filesystem::path& root,
                             const UnitGraph& graph,
                             size_t& skipped_dependents);

    IVcsProvider& m_vcs;
    IWorkspaceProvider& m_workspace;
    ITestInvoker& m_invoker;
    IReporter& m_reporter;
    RunnerPreflight m_preflight;
};

/**
 * @brief Follow-up hint shown below a fatal error, if there is one.
 */
std::optional<std::string> tip_for(const Error& error);

} // namespace deltatest
