#include "kiln/change_detector.hpp"

#include "kiln/worker_pool.hpp"

#include <format>
#include <optional>

namespace kiln {

Result<ChangeMap> find_source_updates(const AssetGraph &graph, const SourceSets &sources, const AssetReader &reader) {
    const AssetIdSet all_sources = sources.all();
    ChangeMap updates;

    AssetIdSet valid_inputs;
    for (const auto &[id, node] : graph.all_nodes()) {
        if (is_valid_input(node)) {
            valid_inputs.insert(id);
        }
    }
    for (const auto &id : sources.input) {
        if (!valid_inputs.contains(id)) {
            updates[id] = ChangeType::Added;
        }
    }

    for (const auto &[id, node] : graph.all_nodes()) {
        if (is_readable(node) && !all_sources.contains(id)) {
            updates[id] = ChangeType::Removed;
        }
    }

    AssetIdSet pre_existing;
    for (const auto &id : graph.sources()) {
        if (sources.input.contains(id)) {
            pre_existing.insert(id);
        }
    }
    for (const auto &id : sources.internal) {
        if (graph.contains(id)) {
            pre_existing.insert(id);
        }
    }

    struct Check {
        AssetId id;
        Digest known;
    };
    std::vector<Check> checks;
    checks.reserve(pre_existing.size());
    for (const auto &id : pre_existing) {
        const AssetNode *node = graph.get(id);
        if (!node) {
            return std::unexpected(Error(ErrorKind::MissingGraphNode, std::format("No graph node for {}", id), {id}));
        }
        const std::optional<Digest> &known = last_known_digest(*node);
        if (!known) {
            continue;
        }
        checks.push_back({id, *known});
    }

    std::vector<Result<bool>> modified(checks.size());
    run_parallel(checks.size(), [&](size_t i) {
        auto current = reader.digest(checks[i].id);
        if (!current) {
            modified[i] = std::unexpected(std::move(current.error()));
            return;
        }
        modified[i] = *current != checks[i].known;
    });

    // Every check has finished; fail on the first error.
    for (size_t i = 0; i < checks.size(); ++i) {
        if (!modified[i]) {
            return std::unexpected(std::move(modified[i].error()));
        }
        if (*modified[i]) {
            updates[checks[i].id] = ChangeType::Modified;
        }
    }
    return updates;
}

Result<ChangeMap> compute_builder_options_updates(AssetGraph &graph, const std::vector<BuildAction> &actions) {
    ChangeMap updates;
    for (size_t phase = 0; phase < actions.size(); ++phase) {
        const auto &action = actions[phase];
        const AssetId id = builder_options_id_for_phase(action.package, phase);
        auto *node = std::get_if<BuilderOptionsNode>(graph.get(id));
        if (!node) {
            return std::unexpected(Error(ErrorKind::MissingGraphNode,
                                         std::format("No builder options node {} for phase {} ({})",
                                                     id,
                                                     phase,
                                                     action.builder),
                                         {id}));
        }

        auto digest = compute_builder_options_digest(action.builder_options);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        if (node->last_known_digest != *digest) {
            node->last_known_digest = std::move(*digest);
            updates[id] = ChangeType::Modified;
        }
    }
    return updates;
}

Result<ChangeMap> detect_changes(AssetGraph &graph,
                                 const std::vector<BuildAction> &actions,
                                 const SourceSets &sources,
                                 const AssetReader &reader) {
    auto updates = find_source_updates(graph, sources, reader);
    if (!updates) {
        return std::unexpected(updates.error());
    }
    auto options_updates = compute_builder_options_updates(graph, actions);
    if (!options_updates) {
        return std::unexpected(options_updates.error());
    }
    for (const auto &[id, type] : *options_updates) {
        (*updates)[id] = type;
    }
    return updates;
}

} // namespace kiln
