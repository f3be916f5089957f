#include "kiln/build_script_updates.hpp"

#include "kiln/constants.hpp"

#include <algorithm>

namespace kiln {

BuildScriptUpdates BuildScriptUpdates::create(const BuildOptions &options, const AssetGraph &graph) {
    BuildScriptUpdates updates;
    updates.tracked_.insert({options.package_graph.root().name, std::string(workspace_manifest)});
    for (const auto &[id, node] : graph.all_nodes()) {
        if (std::holds_alternative<InternalNode>(node)) {
            updates.tracked_.insert(id);
        }
    }
    return updates;
}

bool BuildScriptUpdates::has_been_updated(const AssetIdSet &updated) const {
    return std::any_of(updated.begin(), updated.end(), [this](const AssetId &id) { return tracked_.contains(id); });
}

} // namespace kiln
