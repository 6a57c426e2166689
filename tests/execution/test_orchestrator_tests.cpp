/**
 * @file test_orchestrator_tests.cpp
 */
#include <gtest/gtest.h>
#include "deltatest/execution/test_orchestrator.hpp"
#include "support/fake_collaborators.hpp"

using namespace deltatest;
using deltatest::testing_support::FakeInvoker;

namespace
{

/// Records listener events as strings.
class RecordingListener : public IRunListener
{
public:
    void on_unit_started(size_t index, size_t total, const Unit& unit) override
    {
        events.push_back("start " + std::to_string(index) + "/" + std::to_string(total) + " " +
                         unit.id);
    }

    void on_unit_output(const Unit& unit, const std::string& chunk) override
    {
        events.push_back("output " + unit.id);
        streamed += chunk;
    }

    void on_unit_finished(const UnitOutcome& outcome) override
    {
        events.push_back(std::string("finish ") + outcome.id + " " + to_string(outcome.status));
    }

    std::vector<std::string> events;
    std::string streamed;
};

class TestOrchestratorTests : public ::testing::Test
{
protected:
    TestOrchestratorTests()
        : m_graph(UnitGraph::build({
              Unit{"a", "a", "/ws/a", {}},
              Unit{"b", "b", "/ws/b", {"a"}},
              Unit{"c", "c", "/ws/c", {"b"}},
          }))
        , m_affected(expand({"a"}, m_graph, true))
    {
    }

    RunReport run(const OrchestratorConfig& config)
    {
        TestOrchestrator orchestrator(m_invoker, config);
        orchestrator.set_listener(&m_listener);
        RunReport report = orchestrator.run(m_affected, m_graph);
        m_final_state = orchestrator.state();
        return report;
    }

    static std::vector<UnitStatus> statuses(const RunReport& report)
    {
        std::vector<UnitStatus> result;
        for (const auto& outcome : report.outcomes)
        {
            result.push_back(outcome.status);
        }
        return result;
    }

    UnitGraph m_graph;
    AffectedSet m_affected;
    FakeInvoker m_invoker;
    RecordingListener m_listener;
    OrchestratorState m_final_state{OrchestratorState::Idle};
};

} // namespace

// ============================================================================
// Basic runs
// ============================================================================

TEST_F(TestOrchestratorTests, Run_AllPass)
{
    auto report = run(OrchestratorConfig{});

    EXPECT_EQ(m_invoker.invoked, (std::vector<UnitId>{"a", "b", "c"}));
    EXPECT_EQ(statuses(report),
              (std::vector<UnitStatus>{UnitStatus::Passed, UnitStatus::Passed, UnitStatus::Passed}));
    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.tool, "fake");
    EXPECT_EQ(m_final_state, OrchestratorState::Completed);

    ASSERT_TRUE(report.outcomes[0].exit_code.has_value());
    EXPECT_EQ(*report.outcomes[0].exit_code, 0);
    EXPECT_EQ(report.outcomes[0].output, "output of a\n");
}

TEST_F(TestOrchestratorTests, Run_StateStartsIdle)
{
    TestOrchestrator orchestrator(m_invoker, OrchestratorConfig{});
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Idle);
}

TEST_F(TestOrchestratorTests, Run_EmptyAffectedSet)
{
    TestOrchestrator orchestrator(m_invoker, OrchestratorConfig{});
    auto report = orchestrator.run(AffectedSet{}, m_graph);
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_TRUE(report.success());
    EXPECT_TRUE(m_invoker.invoked.empty());
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Completed);
}

TEST_F(TestOrchestratorTests, Run_PassthroughArgsVerbatim)
{
    OrchestratorConfig config;
    config.passthrough_args = {"--", "--nocapture", "name with space"};
    run(config);
    EXPECT_EQ(m_invoker.last_args, config.passthrough_args);
}

TEST_F(TestOrchestratorTests, Run_UnknownUnitFailsBeforeInvoking)
{
    AffectedSet affected;
    affected.entries = {{"a", true}, {"zzz", true}};
    TestOrchestrator orchestrator(m_invoker, OrchestratorConfig{});
    EXPECT_THROW(orchestrator.run(affected, m_graph), GraphError);
    EXPECT_TRUE(m_invoker.invoked.empty());
}

// ============================================================================
// Fail-fast
// ============================================================================

TEST_F(TestOrchestratorTests, FailFast_SkipsRemainingUnits)
{
    m_invoker.exit_codes["b"] = 101;
    auto report = run(OrchestratorConfig{});

    EXPECT_EQ(m_invoker.invoked, (std::vector<UnitId>{"a", "b"}));
    EXPECT_EQ(statuses(report),
              (std::vector<UnitStatus>{UnitStatus::Passed, UnitStatus::Failed, UnitStatus::Skipped}));
    EXPECT_EQ(report.status, RunStatus::Failure);
    EXPECT_EQ(m_final_state, OrchestratorState::StoppedFailFast);

    const auto& skipped = report.outcomes[2];
    EXPECT_FALSE(skipped.exit_code.has_value());
    EXPECT_TRUE(skipped.output.empty());
    EXPECT_EQ(skipped.note, "skipped after failure of b");
}

TEST_F(TestOrchestratorTests, FailFast_FirstUnitFails)
{
    m_invoker.exit_codes["a"] = 1;
    auto report = run(OrchestratorConfig{});

    EXPECT_EQ(m_invoker.invoked, (std::vector<UnitId>{"a"}));
    EXPECT_EQ(report.failed_count(), 1u);
    EXPECT_EQ(report.skipped_count(), 2u);
    EXPECT_EQ(report.outcomes.size(), m_affected.size());
}

TEST_F(TestOrchestratorTests, NoFailFast_AttemptsEveryUnit)
{
    m_invoker.exit_codes["a"] = 1;
    m_invoker.exit_codes["b"] = 2;

    OrchestratorConfig config;
    config.fail_fast = false;
    auto report = run(config);

    EXPECT_EQ(m_invoker.invoked, (std::vector<UnitId>{"a", "b", "c"}));
    EXPECT_EQ(statuses(report),
              (std::vector<UnitStatus>{UnitStatus::Failed, UnitStatus::Failed, UnitStatus::Passed}));
    EXPECT_EQ(report.status, RunStatus::Failure);
    EXPECT_EQ(report.skipped_count(), 0u);
    EXPECT_EQ(m_final_state, OrchestratorState::Completed);
}

TEST_F(TestOrchestratorTests, NoFailFast_SuccessWhenNothingFails)
{
    OrchestratorConfig config;
    config.fail_fast = false;
    auto report = run(config);
    EXPECT_EQ(report.status, RunStatus::Success);
}

TEST_F(TestOrchestratorTests, SignalExitIsFailure)
{
    m_invoker.exit_codes["a"] = 128 + 9;
    auto report = run(OrchestratorConfig{});
    EXPECT_EQ(report.outcomes[0].status, UnitStatus::Failed);
    EXPECT_EQ(report.outcomes[0].exit_code.value_or(-1), 137);
}

// ============================================================================
// Start failures
// ============================================================================

TEST_F(TestOrchestratorTests, StartFailure_IsFailedOutcome)
{
    m_invoker.unstartable.insert("a");
    auto report = run(OrchestratorConfig{});

    const auto& outcome = report.outcomes[0];
    EXPECT_EQ(outcome.status, UnitStatus::Failed);
    EXPECT_FALSE(outcome.exit_code.has_value());
    EXPECT_NE(outcome.note.find("Failed to execute"), std::string::npos);
    EXPECT_NE(outcome.output.find("Failed to execute"), std::string::npos);

    // Fail-fast applies to start failures as well
    EXPECT_EQ(report.outcomes[1].status, UnitStatus::Skipped);
    EXPECT_EQ(report.outcomes[2].status, UnitStatus::Skipped);
}

TEST_F(TestOrchestratorTests, StartFailure_ContinuesWithoutFailFast)
{
    m_invoker.unstartable.insert("b");
    OrchestratorConfig config;
    config.fail_fast = false;
    auto report = run(config);

    EXPECT_EQ(statuses(report),
              (std::vector<UnitStatus>{UnitStatus::Passed, UnitStatus::Failed, UnitStatus::Passed}));
}

// ============================================================================
// Dry run
// ============================================================================

TEST_F(TestOrchestratorTests, DryRun_InvokesNothing)
{
    m_invoker.exit_codes["a"] = 1;
    OrchestratorConfig config;
    config.dry_run = true;
    auto report = run(config);

    EXPECT_TRUE(m_invoker.invoked.empty());
    EXPECT_EQ(report.outcomes.size(), 3u);
    for (const auto& outcome : report.outcomes)
    {
        EXPECT_EQ(outcome.status, UnitStatus::Skipped);
        EXPECT_EQ(outcome.note, "dry run");
        EXPECT_FALSE(outcome.exit_code.has_value());
    }
    EXPECT_TRUE(report.dry_run);
    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_EQ(m_final_state, OrchestratorState::Completed);
}

// ============================================================================
// Listener
// ============================================================================

TEST_F(TestOrchestratorTests, Listener_ReceivesEventsInOrder)
{
    m_invoker.exit_codes["b"] = 1;
    run(OrchestratorConfig{});

    EXPECT_EQ(m_listener.events, (std::vector<std::string>{
                                     "start 0/3 a",
                                     "finish a passed",
                                     "start 1/3 b",
                                     "finish b failed",
                                     "finish c skipped",
                                 }));
}

TEST_F(TestOrchestratorTests, Verbose_StreamsOutputToListener)
{
    OrchestratorConfig config;
    config.verbose = true;
    auto report = run(config);

    EXPECT_EQ(m_listener.streamed, "output of a\noutput of b\noutput of c\n");
    // Streamed output is retained as well
    EXPECT_EQ(report.outcomes[1].output, "output of b\n");
}

TEST_F(TestOrchestratorTests, Quiet_DoesNotStream)
{
    run(OrchestratorConfig{});
    EXPECT_TRUE(m_listener.streamed.empty());
}
