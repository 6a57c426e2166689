#include "deltatest/reporting/json_reporter.hpp"

#include "deltatest/reporting/result_reporter.hpp"

namespace deltatest
{

using json = nlohmann::json;

JsonReporter::JsonReporter(std::ostream& out, bool verbose)
    : m_out(out)
    , m_verbose(verbose)
{
}

void JsonReporter::emit(const char* event, json payload)
{
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    json line;
    line["event"] = event;
    line["payload"] = std::move(payload);
    line["timestamp_ms"] = now.count();
    m_out << dump_json(line) << '\n';
    m_out.flush();
}

void JsonReporter::plan(const AffectedSet& affected,
                        const UnitGraph& graph,
                        bool skip_dependents,
                        size_t skipped_dependents)
{
    json units = json::array();
    for (const auto& entry : affected.entries)
    {
        units.push_back({
            {"id", entry.id},
            {"name", graph.at(entry.id).name},
            {"direct", entry.direct},
        });
    }
    emit("plan", {
                     {"origin", to_string(affected.origin)},
                     {"changed", affected.direct_count()},
                     {"dependents", affected.dependent_count()},
                     {"skip_dependents", skip_dependents},
                     {"skipped_dependents", skipped_dependents},
                     {"units", std::move(units)},
                 });
}

void JsonReporter::no_units()
{
    emit("no_units", json::object());
}

void JsonReporter::finished(const RunReport& report)
{
    emit("finished", report_to_json(report));
}

void JsonReporter::error(const std::string& message)
{
    emit("error", {{"message", message}});
}

void JsonReporter::note(const std::string& message)
{
    emit("note", {{"message", message}});
}

void JsonReporter::tip(const std::string& message)
{
    emit("tip", {{"message", message}});
}

void JsonReporter::on_unit_started(size_t index, size_t total, const Unit& unit)
{
    emit("unit_started", {
                             {"index", index},
                             {"total", total},
                             {"id", unit.id},
                             {"name", unit.name},
                         });
}

void JsonReporter::on_unit_output(const Unit& unit, const std::string& chunk)
{
    if (m_verbose)
    {
        emit("unit_output", {{"id", unit.id}, {"chunk", chunk}});
    }
}

void JsonReporter::on_unit_finished(const UnitOutcome& outcome)
{
    emit("unit_finished", outcome_to_json(outcome));
}

} // namespace deltatest
