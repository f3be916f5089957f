#pragma once

#include "kiln/asset_graph.hpp"
#include "kiln/asset_io.hpp"
#include "kiln/build_action.hpp"
#include "kiln/source_enumerator.hpp"
#include "kiln/utility.hpp"

#include <vector>

namespace kiln {

/**
 * @brief Diffs what is on disk against what the graph last saw.
 *
 * - Added: input sources without a valid input node.
 * - Removed: readable nodes no longer found anywhere on disk.
 * - Modified: known sources (and tracked internal assets) whose content
 *   digest changed. Nodes that were never digested are skipped.
 *
 * Digests are computed concurrently; one failure fails the whole pass.
 */
Result<ChangeMap> find_source_updates(const AssetGraph &graph, const SourceSets &sources, const AssetReader &reader);

/**
 * @brief Compares every phase's builder options with the digest stored in the graph.
 *
 * Changed phases are reported as Modified and their stored digest is
 * refreshed in place. A phase without its builder options node is an error.
 */
Result<ChangeMap> compute_builder_options_updates(AssetGraph &graph, const std::vector<BuildAction> &actions);

/** @brief Source updates merged with builder options updates; the latter win on collision. */
Result<ChangeMap> detect_changes(AssetGraph &graph,
                                 const std::vector<BuildAction> &actions,
                                 const SourceSets &sources,
                                 const AssetReader &reader);

} // namespace kiln
