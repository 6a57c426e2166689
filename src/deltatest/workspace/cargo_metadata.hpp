/**
 * @file cargo_metadata.hpp
 * @brief Cargo workspace metadata: `cargo metadata` JSON to units.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/workspace/workspace_provider.hpp"

namespace deltatest
{

/**
 * @brief Convert `cargo metadata --format-version 1` output into units.
 *
 * @details
 * One unit per entry of `packages`:
 * - identifier and display name are the package name;
 * - the root is the directory of `manifest_path`;
 * - dependencies are the declared dependencies (of any kind) that name
 *   another workspace package, in declaration order and without repeats.
 *   External crates are not units and are left out.
 *
 * @throw GraphError with `MetadataUnavailable` if the text is not valid JSON
 *        or lacks the expected fields.
 */
std::vector<Unit> parse_cargo_metadata(const std::string& json_text);

/**
 * @brief IWorkspaceProvider that runs `cargo metadata`.
 *
 * @details
 * Runs `cargo metadata --format-version 1 --no-deps --all-features
 * --manifest-path <root>/Cargo.toml`.
 */
class CargoWorkspace : public IWorkspaceProvider
{
public:
    std::vector<Unit> load_units(const std::filesystem::path& workspace_root) override;
};

} // namespace deltatest
