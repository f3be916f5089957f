#pragma once

#include "kiln/asset_graph.hpp"
#include "kiln/build_action.hpp"
#include "kiln/build_cache.hpp"
#include "kiln/build_script_updates.hpp"
#include "kiln/options.hpp"
#include "kiln/package_graph.hpp"
#include "kiln/resource_manager.hpp"
#include "kiln/utility.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace kiln {

/// Notified of every asset kiln deletes. Must not throw.
using OnDelete = std::function<void(const AssetId &)>;

/**
 * @brief A workspace that is ready to build.
 *
 * Produced by `prepare_workspace`, which reuses the cached asset graph when it
 * can still be trusted and builds a fresh one otherwise.
 */
struct BuildDefinition {
    std::shared_ptr<AssetGraph> asset_graph;
    std::shared_ptr<BuildCacheReader> reader;
    std::shared_ptr<BuildCacheWriter> writer;
    PackageGraph package_graph;
    bool delete_files_by_default = false;
    ResourceManager resource_manager;
    std::optional<BuildScriptUpdates> build_script_updates;
    bool enable_low_resources_mode = false;
    OnDelete on_delete;
    /// Changes applied to the cached graph; empty when the graph was built from scratch.
    ChangeMap updates;
    /// Whether `asset_graph` came from the previous build.
    bool from_cache = false;

    /**
     * @brief Brings the workspace up to date before a build.
     *
     * 1. Rejects visible outputs outside the root package.
     * 2. Lists the sources on disk.
     * 3. Loads the cached graph and applies the changes found since, unless the
     *    build configuration itself changed.
     * 4. Otherwise builds a new graph and deals with outputs that already exist.
     *
     * @param options Packages, I/O and policy for this pass.
     * @param actions The ordered build phases.
     * @param on_delete Notified for every asset deleted along the way.
     * @return The prepared workspace, or the fatal error that stopped preparation.
     */
    static Result<BuildDefinition> prepare_workspace(const BuildOptions &options,
                                                     std::vector<BuildAction> actions,
                                                     OnDelete on_delete = {});
};

/**
 * @brief Checks that only the root package has visible outputs.
 * @return An `ErrorKind::InvalidBuildAction` error naming the first offending action.
 */
Result<void> check_build_actions(const std::vector<BuildAction> &actions, const std::string &root_package);

} // namespace kiln
