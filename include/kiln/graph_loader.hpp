#pragma once

#include "kiln/asset_graph.hpp"
#include "kiln/build_action.hpp"
#include "kiln/options.hpp"

#include <expected>
#include <string_view>
#include <vector>

namespace kiln {

/** @brief Why no cached graph could be used. */
enum class CacheMiss {
    Absent,          ///< Nothing was persisted.
    VersionMismatch, ///< Written by another format version; the generated output directory is already gone.
    ActionsChanged,  ///< The build actions changed since; the caller should discard generated output.
    Unreadable,      ///< Could not be read or parsed.
};

std::string_view to_string(CacheMiss miss);

/**
 * @brief Loads the asset graph persisted by the previous build.
 *
 * Never fails the build: every problem is logged and reported as a cache miss.
 */
std::expected<AssetGraph, CacheMiss> try_read_cached_graph(const BuildOptions &options,
                                                           const std::vector<BuildAction> &actions);

/** @brief Recursively deletes the generated output directory of the root package. */
Result<void> delete_generated_dir(const PackageGraph &packages);

} // namespace kiln
