/**
 * @file console_reporter.hpp
 */
#pragma once
#include "deltatest/reporting/reporter.hpp"
#include "deltatest/reporting/text_style.hpp"

namespace deltatest
{

/**
 * @brief Human-readable reporter.
 *
 * @details
 * Progress and the final report go to `out`; `error()` goes to `err`.
 * In verbose mode test output is echoed as it is produced; otherwise each
 * unit gets a single `test crate <name> ... ok` line and only failed output
 * is shown, after the run.
 */
class ConsoleReporter : public IReporter
{
public:
    ConsoleReporter(std::ostream& out, std::ostream& err, TextStyle style, bool verbose);

    void plan(const AffectedSet& affected,
              const UnitGraph& graph,
              bool skip_dependents,
              size_t skipped_dependents) override;
    void no_units() override;
    void finished(const RunReport& report) override;
    void error(const std::string& message) override;
    void note(const std::string& message) override;
    void tip(const std::string& message) override;

    void on_unit_started(size_t index, size_t total, const Unit& unit) override;
    void on_unit_output(const Unit& unit, const std::string& chunk) override;
    void on_unit_finished(const UnitOutcome& outcome) override;

private:
    std::ostream& m_out;
    std::ostream& m_err;
    TextStyle m_style;
    bool m_verbose;

    /// True between on_unit_started() and on_unit_finished() of one unit.
    bool m_unit_open{false};
};

} // namespace deltatest
