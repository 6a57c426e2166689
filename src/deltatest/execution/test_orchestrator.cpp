#include "deltatest/execution/test_orchestrator.hpp"

#include "deltatest/common/errors.hpp"
#include "deltatest/common/log.hpp"

namespace deltatest
{

const char* to_string(OrchestratorState state) noexcept
{
    switch (state)
    {
    case OrchestratorState::Idle:
        return "idle";
    case OrchestratorState::Running:
        return "running";
    case OrchestratorState::StoppedFailFast:
        return "stopped_fail_fast";
    case OrchestratorState::Completed:
        return "completed";
    }
    return "unknown";
}

TestOrchestrator::TestOrchestrator(ITestInvoker& invoker, OrchestratorConfig config)
    : m_invoker(invoker)
    , m_config(std::move(config))
{
}

RunReport TestOrchestrator::run(const AffectedSet& affected, const UnitGraph& graph)
{
    // Resolve every unit up front so that a bad identifier fails the run
    // before anything is executed.
    std::vector<const Unit*> units;
    units.reserve(affected.size());
    for (const auto& entry : affected.entries)
    {
        units.push_back(&graph.at(entry.id));
    }

    RunReport report;
    report.dry_run = m_config.dry_run;
    report.fail_fast = m_config.fail_fast;
    report.origin = affected.origin;
    report.tool = m_invoker.tool_name();

    auto start_time = std::chrono::steady_clock::now();
    m_state = OrchestratorState::Running;
    DELTATEST_LOG_INFO("exec", "testing " << units.size() << " units with " << report.tool);

    std::string first_failure;
    for (size_t index = 0; index < units.size(); ++index)
    {
        const Unit& unit = *units[index];

        if (m_config.dry_run)
        {
            finish(skipped(unit, "dry run"), report);
            continue;
        }
        if (m_state == OrchestratorState::StoppedFailFast)
        {
            finish(skipped(unit, "skipped after failure of " + first_failure), report);
            continue;
        }

        if (m_listener)
        {
            m_listener->on_unit_started(index, units.size(), unit);
        }
        UnitOutcome outcome = attempt(unit);
        if (outcome.status == UnitStatus::Failed && first_failure.empty())
        {
            first_failure = unit.name;
            if (m_config.fail_fast)
            {
                DELTATEST_LOG_INFO("exec", "stopping after failure of " << unit.name);
                m_state = OrchestratorState::StoppedFailFast;
            }
        }
        finish(std::move(outcome), report);
    }

    if (m_state == OrchestratorState::Running)
    {
        m_state = OrchestratorState::Completed;
    }
    report.status = report.failed_count() == 0 ? RunStatus::Success : RunStatus::Failure;
    report.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    DELTATEST_LOG_INFO("exec", report.summary());
    return report;
}

UnitOutcome TestOrchestrator::attempt(const Unit& unit)
{
    UnitOutcome outcome;
    outcome.id = unit.id;
    outcome.name = unit.name;

    InvokeOptions options;
    if (m_config.verbose && m_listener)
    {
        IRunListener* listener = m_listener;
        options.on_output = [listener, &unit](const std::string& chunk) {
            listener->on_unit_output(unit, chunk);
        };
    }

    auto start_time = std::chrono::steady_clock::now();
    try
    {
        InvocationResult result = m_invoker.invoke(unit, m_config.passthrough_args, options);
        outcome.exit_code = result.exit_code;
        outcome.output = std::move(result.output);
        outcome.duration = result.duration;
        outcome.status = result.exit_code == 0 ? UnitStatus::Passed : UnitStatus::Failed;
    }
    catch (const InvocationError& e)
    {
        DELTATEST_LOG_WARN("exec", "could not start tests for " << unit.name << ": " << e.what());
        outcome.status = UnitStatus::Failed;
        outcome.note = e.what();
        outcome.output = e.what();
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    }
    return outcome;
}

UnitOutcome TestOrchestrator::skipped(const Unit& unit, std::string note) const
{
    UnitOutcome outcome;
    outcome.id = unit.id;
    outcome.name = unit.name;
    outcome.status = UnitStatus::Skipped;
    outcome.note = std::move(note);
    return outcome;
}

void TestOrchestrator::finish(UnitOutcome outcome, RunReport& report)
{
    report.outcomes.push_back(std::move(outcome));
    if (m_listener)
    {
        m_listener->on_unit_finished(report.outcomes.back());
    }
}

} // namespace deltatest
