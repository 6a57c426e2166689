/**
 * @file cargo_metadata.cpp
 */
#include "deltatest/workspace/cargo_metadata.hpp"

#include "deltatest/common/errors.hpp"
#include "deltatest/common/log.hpp"
#include "deltatest/common/path_utils.hpp"
#include "deltatest/execution/process_runner.hpp"

#include <nlohmann/json.hpp>

namespace deltatest
{

using json = nlohmann::json;

std::vector<Unit> parse_cargo_metadata(const std::string& json_text)
{
    json document;
    try
    {
        document = json::parse(json_text);
    }
    catch (const json::parse_error& e)
    {
        throw GraphError(GraphErrorCode::MetadataUnavailable,
                         std::string("Failed to parse cargo metadata: ") + e.what());
    }

    std::vector<Unit> units;
    try
    {
        const json& packages = document.at("packages");
        std::unordered_set<std::string> workspace_names;
        for (const auto& package : packages)
        {
            workspace_names.insert(package.at("name").get<std::string>());
        }

        for (const auto& package : packages)
        {
            Unit unit;
            unit.name = package.at("name").get<std::string>();
            unit.id = unit.name;

            fs::path manifest = package.at("manifest_path").get<std::string>();
            unit.root = normalize_path(manifest.parent_path());
            if (unit.root.empty())
            {
                throw GraphError(GraphErrorCode::MetadataUnavailable,
                                 "Package '" + unit.name + "' has no manifest directory");
            }

            std::unordered_set<std::string> seen;
            auto deps = package.find("dependencies");
            if (deps != package.end())
            {
                for (const auto& dep : *deps)
                {
                    std::string dep_name = dep.at("name").get<std::string>();
                    if (workspace_names.count(dep_name) != 0 && seen.insert(dep_name).second)
                    {
                        unit.dependencies.push_back(dep_name);
                    }
                }
            }
            units.push_back(std::move(unit));
        }
    }
    catch (const json::exception& e)
    {
        throw GraphError(GraphErrorCode::MetadataUnavailable,
                         std::string("Unexpected cargo metadata layout: ") + e.what());
    }

    DELTATEST_LOG_DEBUG("workspace", "cargo metadata lists " << units.size() << " packages");
    return units;
}

std::vector<Unit> CargoWorkspace::load_units(const fs::path& workspace_root)
{
    std::vector<std::string> argv{
        "cargo",         "metadata",
        "--format-version", "1",
        "--no-deps",     "--all-features",
        "--manifest-path", (workspace_root / "Cargo.toml").string(),
    };

    ProcessOptions options;
    options.working_directory = workspace_root;
    options.merge_stderr = false;

    ProcessResult result;
    try
    {
        result = run_process(argv, options);
    }
    catch (const InvocationError& e)
    {
        throw GraphError(GraphErrorCode::MetadataUnavailable,
                         std::string("Failed to run cargo metadata: ") + e.what());
    }

    if (!result.success())
    {
        std::string detail = result.error_output;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
        {
            detail.pop_back();
        }
        throw GraphError(GraphErrorCode::MetadataUnavailable,
                         "cargo metadata failed with exit code " +
                             std::to_string(result.exit_code) +
                             (detail.empty() ? "" : ": " + detail));
    }
    return parse_cargo_metadata(result.output);
}

} // namespace deltatest
