/**
 * @file app.cpp
 */
#include "deltatest/app/app.hpp"

#include "deltatest/common/log.hpp"
#include "deltatest/execution/test_orchestrator.hpp"
#include "deltatest/reporting/result_reporter.hpp"
#include "deltatest/resolve/affected_set.hpp"
#include "deltatest/resolve/change_resolver.hpp"

namespace deltatest
{

App::App(IVcsProvider& vcs,
         IWorkspaceProvider& workspace,
         ITestInvoker& invoker,
         IReporter& reporter,
         RunnerPreflight preflight)
    : m_vcs(vcs)
    , m_workspace(workspace)
    , m_invoker(invoker)
    , m_reporter(reporter)
    , m_preflight(std::move(preflight))
{
}

ExitCode App::run(const RunConfig& config)
{
    try
    {
        return run_pipeline(config);
    }
    catch (const Error& e)
    {
        DELTATEST_LOG_DEBUG("app", "fatal error: " << e.what());
        m_reporter.error(e.what());
        if (auto tip = tip_for(e))
        {
            m_reporter.tip(*tip);
        }
        return e.exit_code();
    }
    catch (const std::exception& e)
    {
        m_reporter.error(std::string("unexpected error: ") + e.what());
        return ExitCode::Unexpected;
    }
}

ExitCode App::run_pipeline(const RunConfig& config)
{
    std::filesystem::path root = m_vcs.workspace_root(config.start_directory);
    DELTATEST_LOG_INFO("app", "workspace root: " << root.generic_string());

    UnitGraph graph = UnitGraph::build(m_workspace.load_units(root));
    DELTATEST_LOG_INFO("app", "workspace has " << graph.size() << " crates");

    size_t skipped_dependents = 0;
    AffectedSet affected = select_units(config, root, graph, skipped_dependents);

    if (affected.empty())
    {
        m_reporter.no_units();
        return ExitCode::Success;
    }

    m_reporter.plan(affected, graph, config.skip_dependents, skipped_dependents);

    if (config.dry_run)
    {
        m_reporter.note("dry run mode enabled, skipping actual tests");
    }
    else if (m_preflight)
    {
        if (auto tip = m_preflight())
        {
            m_reporter.note(m_invoker.tool_name() + " does not appear to be available");
            m_reporter.tip(*tip);
        }
    }

    OrchestratorConfig orchestrator_config;
    orchestrator_config.fail_fast = config.fail_fast;
    orchestrator_config.dry_run = config.dry_run;
    orchestrator_config.verbose = config.verbose;
    orchestrator_config.passthrough_args = config.passthrough_args;

    TestOrchestrator orchestrator(m_invoker, orchestrator_config);
    orchestrator.set_listener(&m_reporter);
    RunReport report = orchestrator.run(affected, graph);

    m_reporter.finished(report);
    return summarize(report);
}

AffectedSet App::select_units(const RunConfig& config,
                              const std::filesystem::path& root,
                              const UnitGraph& graph,
                              size_t& skipped_dependents)
{
    skipped_dependents = 0;
    if (!config.override_units.empty())
    {
        return from_override(config.override_units, graph);
    }

    std::vector<ChangedFile> changes;
    if (config.from_ref)
    {
        DELTATEST_LOG_INFO("app", "comparing " << *config.from_ref << ".." << config.to_ref);
        changes = m_vcs.changes_between(root, *config.from_ref, config.to_ref);
    }
    else
    {
        changes = m_vcs.uncommitted_changes(root);
    }
    DELTATEST_LOG_INFO("app", changes.size() << " changed files");

    UnitIdSet direct = resolve(changes, graph, root);
    if (config.skip_dependents && !direct.empty())
    {
        skipped_dependents = graph.transitive_dependents_of(direct).size() - direct.size();
    }
    return expand(direct, graph, !config.skip_dependents);
}

std::optional<std::string> tip_for(const Error& error)
{
    if (const auto* diff = dynamic_cast<const DiffError*>(&error))
    {
        switch (diff->code())
        {
        case DiffErrorCode::RepositoryNotFound:
            return std::string("run inside a git repository, or pass one with '-C <dir>'");
        case DiffErrorCode::InvalidReference:
            return std::string("check the reference with 'git rev-parse --verify <ref>'");
        default:
            return std::nullopt;
        }
    }
    if (const auto* graph = dynamic_cast<const GraphError*>(&error))
    {
        if (graph->code() == GraphErrorCode::MetadataUnavailable)
        {
            return std::string("check that 'cargo metadata' succeeds in the workspace root");
        }
        return std::nullopt;
    }
    if (dynamic_cast<const UsageError*>(&error) != nullptr)
    {
        return std::string("run 'deltatest --help' for usage");
    }
    return std::nullopt;
}

} // namespace deltatest
