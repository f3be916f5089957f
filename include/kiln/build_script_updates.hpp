#pragma once

#include "kiln/asset_graph.hpp"
#include "kiln/asset_id.hpp"
#include "kiln/options.hpp"

namespace kiln {

/**
 * @brief Detects whether the build configuration itself changed.
 *
 * The configuration is the root manifest plus every internal asset the graph
 * tracks (the generated build script lives under the entry point directory).
 * A cached graph built under a different configuration cannot be trusted.
 */
class BuildScriptUpdates {
public:
    static BuildScriptUpdates create(const BuildOptions &options, const AssetGraph &graph);

    /** @brief Whether any of `updated` is part of the build configuration. */
    bool has_been_updated(const AssetIdSet &updated) const;

    const AssetIdSet &tracked() const {
        return tracked_;
    }

private:
    AssetIdSet tracked_;
};

} // namespace kiln
