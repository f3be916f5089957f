#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/asset_io.hpp"
#include "kiln/asset_node.hpp"
#include "kiln/build_action.hpp"
#include "kiln/package_graph.hpp"
#include "kiln/utility.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief Every asset the build knows about and how they relate.
 *
 * Sources feed build phases which declare generated outputs; each phase also
 * owns a node holding the digest of its builder options. The graph can be
 * persisted between builds and brought up to date from a change map.
 */
class AssetGraph {
public:
    /**
     * @brief Creates a graph from scratch.
     *
     * Declared outputs that collide with an existing source replace that
     * source; the caller decides what to do with the file on disk.
     *
     * @param actions The ordered build phases.
     * @param input_sources Package files found on disk.
     * @param internal_sources kiln's own bookkeeping assets; these are digested immediately.
     * @param packages Packages every source must belong to.
     * @param reader Used to digest internal sources.
     * @return The graph, or an error on duplicate outputs or unknown packages.
     */
    static Result<AssetGraph> build(const std::vector<BuildAction> &actions,
                                    const AssetIdSet &input_sources,
                                    const AssetIdSet &internal_sources,
                                    const PackageGraph &packages,
                                    const AssetReader &reader);

    /**
     * @brief Restores a graph written by `serialize`.
     * @return The graph, an `ErrorKind::VersionMismatch` error for graphs written
     *         by another format version, or a generic error for anything unparsable.
     */
    static Result<AssetGraph> deserialize(std::string_view text);

    std::string serialize() const;

    AssetNode *get(const AssetId &id);
    const AssetNode *get(const AssetId &id) const;

    bool contains(const AssetId &id) const {
        return nodes_.contains(id);
    }

    const std::map<AssetId, AssetNode> &all_nodes() const {
        return nodes_;
    }

    /** @brief Ids of all package source nodes. */
    AssetIdSet sources() const;

    /** @brief Ids of all declared outputs. */
    AssetIdSet outputs() const;

    const Digest &build_actions_digest() const {
        return build_actions_digest_;
    }

    /**
     * @brief Applies a change map and invalidates everything downstream of it.
     *
     * - added sources get nodes and their declared outputs;
     * - removed sources are dropped along with their outputs, deleting those
     *   that had been emitted through `delete_fn`;
     * - removed outputs are marked for regeneration;
     * - modified sources lose their digest and dirty their outputs;
     * - modified builder options dirty every output of that phase.
     */
    Result<void> update_and_invalidate(const std::vector<BuildAction> &actions,
                                       const ChangeMap &changes,
                                       const DeleteCallback &delete_fn,
                                       const AssetReader &reader);

    /** @brief Digests every source and internal node that has no digest yet. */
    Result<void> refresh_digests(const AssetReader &reader);

private:
    Result<void> add_outputs(const std::vector<BuildAction> &actions, std::vector<AssetId> inputs);
    Result<void> remove_recursive(const AssetId &id, const DeleteCallback *delete_fn);
    void invalidate_outputs(const AssetId &id);

    std::map<AssetId, AssetNode> nodes_;
    Digest build_actions_digest_;
};

} // namespace kiln
