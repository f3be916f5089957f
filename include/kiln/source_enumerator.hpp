#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/asset_io.hpp"
#include "kiln/package_graph.hpp"
#include "kiln/utility.hpp"

#include <string>
#include <vector>

namespace kiln {

/** @brief What is on disk right now, split by where it was found. */
struct SourceSets {
    AssetIdSet input;     ///< Files owned by packages.
    AssetIdSet cache_dir; ///< Previously generated hidden outputs, mapped back to their own ids.
    AssetIdSet internal;  ///< kiln's bookkeeping assets.

    AssetIdSet all() const;
};

/** @brief The globs that select the input sources of `package`. */
std::vector<std::string> package_includes(const PackageNode &package);

/**
 * @brief Lists the input sources of every package.
 *
 * Packages are listed concurrently; any failure fails the whole listing.
 */
Result<AssetIdSet> find_input_sources(const PackageGraph &packages, const AssetReader &reader);

/** @brief Lists hidden outputs from a previous build under the generated output directory. */
Result<AssetIdSet> find_cache_dir_sources(const AssetReader &reader);

/** @brief Lists everything under the entry point directory. */
Result<AssetIdSet> find_internal_sources(const AssetReader &reader);

Result<SourceSets> find_sources(const PackageGraph &packages, const AssetReader &reader);

} // namespace kiln
