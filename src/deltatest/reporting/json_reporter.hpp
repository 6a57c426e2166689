/**
 * @file json_reporter.hpp
 */
#pragma once
#include "deltatest/reporting/reporter.hpp"

#include <nlohmann/json.hpp>

namespace deltatest
{

/**
 * @brief Machine-readable reporter writing one JSON object per line.
 *
 * @details
 * Every line has the shape
 * `{"event": "<name>", "payload": {...}, "timestamp_ms": <unix millis>}`.
 * Events: `plan`, `unit_started`, `unit_output` (verbose only),
 * `unit_finished`, `no_units`, `finished` (payload: the full report as
 * produced by `report_to_json()`), `error`, `note` and `tip`.
 */
class JsonReporter : public IReporter
{
public:
    JsonReporter(std::ostream& out, bool verbose);

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
    void emit(const char* event, nlohmann::json payload);

    std::ostream& m_out;
    bool m_verbose;
};

} // namespace deltatest
