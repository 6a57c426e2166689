/**
 * @file workspace_provider.hpp
 * @brief IWorkspaceProvider interface: where the unit list comes from.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/graph/unit.hpp"

namespace deltatest
{

/**
 * @brief Interface for workspace metadata providers.
 */
class IWorkspaceProvider
{
public:
    virtual ~IWorkspaceProvider() = default;

    /**
     * @brief Load every unit of the workspace rooted at `workspace_root`.
     * @return Units with absolute roots and workspace-internal dependencies.
     * @throw GraphError with `MetadataUnavailable` if the metadata cannot be
     *        produced or parsed.
     */
    virtual std::vector<Unit> load_units(const std::filesystem::path& workspace_root) = 0;
};

} // namespace deltatest
