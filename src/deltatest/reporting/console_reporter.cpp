#include "deltatest/reporting/console_reporter.hpp"

#include "deltatest/reporting/result_reporter.hpp"

namespace deltatest
{

namespace
{

std::string plural(size_t count, const char* one, const char* many)
{
    return std::to_string(count) + " " + (count == 1 ? one : many);
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& err, TextStyle style, bool verbose)
    : m_out(out)
    , m_err(err)
    , m_style(style)
    , m_verbose(verbose)
{
}

void ConsoleReporter::plan(const AffectedSet& affected,
                           const UnitGraph& graph,
                           bool skip_dependents,
                           size_t skipped_dependents)
{
    (void)graph;
    if (affected.origin == AffectedOrigin::Override)
    {
        m_out << "testing " << plural(affected.size(), "selected crate", "selected crates")
              << "\n\n";
    }
    else
    {
        size_t dependents = skip_dependents ? skipped_dependents : affected.dependent_count();
        m_out << "discovered " << plural(affected.direct_count(), "changed crate", "changed crates")
              << "; " << (skip_dependents ? "skipping " : "")
              << plural(dependents, "dependent crate", "dependent crates") << "\n\n";
    }
    m_out.flush();
}

void ConsoleReporter::no_units()
{
    m_out << "no crates to test\n";
    m_out.flush();
}

void ConsoleReporter::finished(const RunReport& report)
{
    m_out << render_failures(report);
    m_out << '\n' << render_summary(report, m_style);
    m_out.flush();
}

void ConsoleReporter::error(const std::string& message)
{
    m_err << m_style.red("error") << ": " << message << '\n';
    m_err.flush();
}

void ConsoleReporter::note(const std::string& message)
{
    m_out << m_style.cyan("note") << ": " << message << '\n';
    m_out.flush();
}

void ConsoleReporter::tip(const std::string& message)
{
    m_out << "  " << m_style.cyan("tip") << ": " << message << '\n';
    m_out.flush();
}

void ConsoleReporter::on_unit_started(size_t index, size_t total, const Unit& unit)
{
    (void)index;
    (void)total;
    m_out << "test crate " << unit.name << (m_verbose ? "\n" : " ... ");
    m_out.flush();
    m_unit_open = true;
}

void ConsoleReporter::on_unit_output(const Unit& unit, const std::string& chunk)
{
    (void)unit;
    if (m_verbose)
    {
        m_out << chunk;
        m_out.flush();
    }
}

void ConsoleReporter::on_unit_finished(const UnitOutcome& outcome)
{
    if (m_unit_open && !m_verbose)
    {
        // The "test crate <name> ... " prefix is already on the line.
        switch (outcome.status)
        {
        case UnitStatus::Passed:
            m_out << m_style.green("ok") << '\n';
            break;
        case UnitStatus::Failed:
            m_out << m_style.red("FAILED") << '\n';
            break;
        case UnitStatus::Skipped:
            m_out << m_style.yellow("skipped") << '\n';
            break;
        }
    }
    else
    {
        m_out << render_unit_line(outcome, m_style);
    }
    m_unit_open = false;
    m_out.flush();
}

} // namespace deltatest
