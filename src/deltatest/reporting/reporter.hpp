/**
 * @file reporter.hpp
 * @brief IReporter: live progress and final report for one invocation.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/execution/test_orchestrator.hpp"
#include "deltatest/graph/unit_graph.hpp"
#include "deltatest/resolve/affected_set.hpp"

namespace deltatest
{

/**
 * @brief Interface for reporters.
 *
 * @details
 * A reporter is also the orchestrator's run listener, so it sees every
 * unit as it starts and finishes. The application calls the remaining
 * methods around the run:
 * - `plan()` once the affected set is known;
 * - `no_units()` instead of a run when the affected set is empty;
 * - `finished()` with the final report;
 * - `error()`, `note()` and `tip()` for messages outside the run.
 */
class IReporter : public IRunListener
{
public:
    /**
     * @brief Announce what is about to be tested.
     * @param affected The affected set.
     * @param graph The graph it was computed from.
     * @param skip_dependents Whether dependents were excluded; the number of
     *        dependents that would have been added is `skipped_dependents`.
     * @param skipped_dependents See above; zero unless `skip_dependents`.
     */
    virtual void plan(const AffectedSet& affected,
                      const UnitGraph& graph,
                      bool skip_dependents,
                      size_t skipped_dependents) = 0;

    virtual void no_units() = 0;

    virtual void finished(const RunReport& report) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void note(const std::string& message) = 0;

    virtual void tip(const std::string& message) = 0;
};

} // namespace deltatest
