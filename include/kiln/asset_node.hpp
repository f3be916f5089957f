#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/digest.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <variant>

namespace kiln {

/** @brief A file supplied by a package. */
struct SourceNode {
    AssetId id;
    std::optional<Digest> last_known_digest;
    std::set<AssetId> primary_outputs;
};

/** @brief A bookkeeping asset owned by kiln itself, such as the build script. */
struct InternalNode {
    AssetId id;
    std::optional<Digest> last_known_digest;
};

/** @brief A file that some phase of the build is declared to produce. */
struct GeneratedNode {
    AssetId id;
    size_t phase = 0;
    AssetId primary_input;
    bool is_hidden = false;
    bool was_output = false; ///< Whether the builder actually emitted this file last time.
    bool needs_update = true;
    std::optional<Digest> last_known_digest;
    std::set<AssetId> primary_outputs; ///< Outputs of later phases that read this one.
};

/** @brief Digest of the options for one build phase. */
struct BuilderOptionsNode {
    AssetId id;
    std::optional<Digest> last_known_digest;
};

using AssetNode = std::variant<SourceNode, InternalNode, GeneratedNode, BuilderOptionsNode>;

const AssetId &node_id(const AssetNode &node);

std::optional<Digest> &last_known_digest(AssetNode &node);
const std::optional<Digest> &last_known_digest(const AssetNode &node);

/**
 * @brief Whether the node currently stands for something that exists.
 *
 * Generated nodes are readable only once they were actually output; builder
 * options never are.
 */
bool is_readable(const AssetNode &node);

/** @brief Whether the node may be the primary input of a build phase. */
bool is_valid_input(const AssetNode &node);

/** @brief Outputs that take this node as primary input, for nodes that can have them. */
const std::set<AssetId> *primary_outputs(const AssetNode &node);
std::set<AssetId> *primary_outputs(AssetNode &node);

} // namespace kiln
