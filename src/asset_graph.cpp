#include "kiln/asset_graph.hpp"

#include "kiln/constants.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>

namespace kiln {

using json = nlohmann::json;

namespace {

json digest_to_json(const std::optional<Digest> &digest) {
    return digest ? json(*digest) : json(nullptr);
}

std::optional<Digest> digest_from_json(const json &j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<std::string>();
}

json ids_to_json(const std::set<AssetId> &ids) {
    json arr = json::array();
    for (const auto &id : ids) {
        arr.push_back(id.to_string());
    }
    return arr;
}

AssetId id_from_json(const json &j) {
    auto id = AssetId::parse(j.get<std::string>());
    if (!id) {
        throw std::invalid_argument(std::format("Malformed asset id: {}", j.get<std::string>()));
    }
    return *id;
}

std::set<AssetId> ids_from_json(const json &j) {
    std::set<AssetId> ids;
    for (const auto &item : j) {
        ids.insert(id_from_json(item));
    }
    return ids;
}

json node_to_json(const AssetNode &node) {
    json j;
    j["id"] = node_id(node).to_string();
    j["digest"] = digest_to_json(last_known_digest(node));
    if (const auto *source = std::get_if<SourceNode>(&node)) {
        j["type"] = "source";
        j["primaryOutputs"] = ids_to_json(source->primary_outputs);
    } else if (std::holds_alternative<InternalNode>(node)) {
        j["type"] = "internal";
    } else if (const auto *generated = std::get_if<GeneratedNode>(&node)) {
        j["type"] = "generated";
        j["phase"] = generated->phase;
        j["primaryInput"] = generated->primary_input.to_string();
        j["isHidden"] = generated->is_hidden;
        j["wasOutput"] = generated->was_output;
        j["needsUpdate"] = generated->needs_update;
        j["primaryOutputs"] = ids_to_json(generated->primary_outputs);
    } else {
        j["type"] = "builderOptions";
    }
    return j;
}

AssetNode node_from_json(const json &j) {
    AssetId id = id_from_json(j.at("id"));
    std::optional<Digest> digest = digest_from_json(j.at("digest"));
    const std::string type = j.at("type").get<std::string>();
    if (type == "source") {
        return SourceNode{std::move(id), std::move(digest), ids_from_json(j.at("primaryOutputs"))};
    }
    if (type == "internal") {
        return InternalNode{std::move(id), std::move(digest)};
    }
    if (type == "generated") {
        return GeneratedNode{
            .id = std::move(id),
            .phase = j.at("phase").get<size_t>(),
            .primary_input = id_from_json(j.at("primaryInput")),
            .is_hidden = j.at("isHidden").get<bool>(),
            .was_output = j.at("wasOutput").get<bool>(),
            .needs_update = j.at("needsUpdate").get<bool>(),
            .last_known_digest = std::move(digest),
            .primary_outputs = ids_from_json(j.at("primaryOutputs")),
        };
    }
    if (type == "builderOptions") {
        return BuilderOptionsNode{std::move(id), std::move(digest)};
    }
    throw std::invalid_argument(std::format("Unknown node type: {}", type));
}

} // namespace

Result<AssetGraph> AssetGraph::build(const std::vector<BuildAction> &actions,
                                     const AssetIdSet &input_sources,
                                     const AssetIdSet &internal_sources,
                                     const PackageGraph &packages,
                                     const AssetReader &reader) {
    AssetGraph graph;
    auto actions_digest = compute_build_actions_digest(actions);
    if (!actions_digest) {
        return std::unexpected(actions_digest.error());
    }
    graph.build_actions_digest_ = std::move(*actions_digest);

    for (size_t phase = 0; phase < actions.size(); ++phase) {
        auto options_digest = compute_builder_options_digest(actions[phase].builder_options);
        if (!options_digest) {
            return std::unexpected(options_digest.error());
        }
        AssetId id = builder_options_id_for_phase(actions[phase].package, phase);
        graph.nodes_.emplace(id, BuilderOptionsNode{id, std::move(*options_digest)});
    }

    for (const auto &id : internal_sources) {
        auto digest = reader.digest(id);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        graph.nodes_.emplace(id, InternalNode{id, std::move(*digest)});
    }

    std::vector<AssetId> sources(input_sources.begin(), input_sources.end());
    std::sort(sources.begin(), sources.end());
    for (const auto &id : sources) {
        if (!packages.find(id.package)) {
            return std::unexpected(Error(ErrorKind::Generic, std::format("Source in unknown package: {}", id), {id}));
        }
        graph.nodes_.emplace(id, SourceNode{id, std::nullopt, {}});
    }

    if (auto res = graph.add_outputs(actions, std::move(sources)); !res) {
        return std::unexpected(res.error());
    }
    return graph;
}

Result<void> AssetGraph::add_outputs(const std::vector<BuildAction> &actions, std::vector<AssetId> inputs) {
    for (size_t phase = 0; phase < actions.size(); ++phase) {
        const auto &action = actions[phase];
        std::vector<AssetId> produced;

        for (const auto &input : inputs) {
            const AssetNode *input_node = get(input);
            if (!input_node || !is_valid_input(*input_node)) {
                continue;
            }
            if (const auto *generated = std::get_if<GeneratedNode>(input_node); generated && generated->phase >= phase) {
                continue;
            }

            for (auto &output : action.expected_outputs(input)) {
                if (output == input) {
                    continue;
                }
                if (const AssetNode *existing = get(output)) {
                    if (const auto *prior = std::get_if<GeneratedNode>(existing);
                        prior && prior->phase == phase && prior->primary_input == input) {
                        continue;
                    }
                    if (!std::holds_alternative<SourceNode>(*existing)) {
                        return std::unexpected(Error(ErrorKind::DuplicateOutput,
                                                     std::format("Output {} is declared by more than one phase", output),
                                                     {output}));
                    }
                    // A source sitting where an output belongs is superseded by the declaration.
                    if (auto res = remove_recursive(output, nullptr); !res) {
                        return res;
                    }
                }
                nodes_.emplace(output,
                               GeneratedNode{
                                   .id = output,
                                   .phase = phase,
                                   .primary_input = input,
                                   .is_hidden = action.hide_output,
                               });
                if (AssetNode *owner = get(input)) {
                    primary_outputs(*owner)->insert(output);
                }
                produced.push_back(std::move(output));
            }
        }
        inputs.insert(inputs.end(), std::make_move_iterator(produced.begin()), std::make_move_iterator(produced.end()));
    }
    return {};
}

Result<void> AssetGraph::remove_recursive(const AssetId &id, const DeleteCallback *delete_fn) {
    AssetNode *node = get(id);
    if (!node) {
        return {};
    }
    if (const auto *outputs = primary_outputs(*node)) {
        std::set<AssetId> children = *outputs;
        for (const auto &child : children) {
            if (auto res = remove_recursive(child, delete_fn); !res) {
                return res;
            }
        }
    }
    if (auto *generated = std::get_if<GeneratedNode>(node)) {
        if (generated->was_output && delete_fn) {
            if (auto res = (*delete_fn)(id); !res) {
                return res;
            }
        }
        if (AssetNode *parent = get(generated->primary_input)) {
            if (auto *siblings = primary_outputs(*parent)) {
                siblings->erase(id);
            }
        }
    }
    nodes_.erase(id);
    return {};
}

void AssetGraph::invalidate_outputs(const AssetId &id) {
    AssetNode *node = get(id);
    if (!node) {
        return;
    }
    const auto *outputs = primary_outputs(*node);
    if (!outputs) {
        return;
    }
    for (const auto &output : *outputs) {
        if (auto *generated = std::get_if<GeneratedNode>(get(output))) {
            generated->needs_update = true;
            invalidate_outputs(output);
        }
    }
}

Result<void> AssetGraph::update_and_invalidate(const std::vector<BuildAction> &actions,
                                               const ChangeMap &changes,
                                               const DeleteCallback &delete_fn,
                                               const AssetReader &reader) {
    std::vector<AssetId> added;

    for (const auto &[id, type] : changes) {
        AssetNode *node = get(id);
        switch (type) {
        case ChangeType::Added:
            if (!node) {
                nodes_.emplace(id, SourceNode{id, std::nullopt, {}});
                added.push_back(id);
            }
            break;

        case ChangeType::Removed:
            if (!node) {
                break;
            }
            if (auto *generated = std::get_if<GeneratedNode>(node)) {
                generated->was_output = false;
                generated->needs_update = true;
                generated->last_known_digest.reset();
                invalidate_outputs(id);
            } else if (auto res = remove_recursive(id, &delete_fn); !res) {
                return res;
            }
            break;

        case ChangeType::Modified:
            if (!node) {
                break;
            }
            if (auto *source = std::get_if<SourceNode>(node)) {
                source->last_known_digest.reset();
                invalidate_outputs(id);
            } else if (auto *internal = std::get_if<InternalNode>(node)) {
                auto digest = reader.digest(id);
                if (!digest) {
                    return std::unexpected(digest.error());
                }
                internal->last_known_digest = std::move(*digest);
            } else if (auto *generated = std::get_if<GeneratedNode>(node)) {
                generated->needs_update = true;
                invalidate_outputs(id);
            } else {
                for (size_t phase = 0; phase < actions.size(); ++phase) {
                    if (builder_options_id_for_phase(actions[phase].package, phase) != id) {
                        continue;
                    }
                    for (auto &[_, candidate] : nodes_) {
                        if (auto *generated = std::get_if<GeneratedNode>(&candidate); generated && generated->phase == phase) {
                            generated->needs_update = true;
                        }
                    }
                }
            }
            break;
        }
    }

    std::sort(added.begin(), added.end());
    return add_outputs(actions, std::move(added));
}

Result<void> AssetGraph::refresh_digests(const AssetReader &reader) {
    for (auto &[id, node] : nodes_) {
        if (!std::holds_alternative<SourceNode>(node) && !std::holds_alternative<InternalNode>(node)) {
            continue;
        }
        auto &digest = last_known_digest(node);
        if (digest || !reader.can_read(id)) {
            continue;
        }
        auto current = reader.digest(id);
        if (!current) {
            return std::unexpected(current.error());
        }
        digest = std::move(*current);
    }
    return {};
}

AssetNode *AssetGraph::get(const AssetId &id) {
    if (auto it = nodes_.find(id); it != nodes_.end()) {
        return &it->second;
    }
    return nullptr;
}

const AssetNode *AssetGraph::get(const AssetId &id) const {
    if (auto it = nodes_.find(id); it != nodes_.end()) {
        return &it->second;
    }
    return nullptr;
}

AssetIdSet AssetGraph::sources() const {
    AssetIdSet ids;
    for (const auto &[id, node] : nodes_) {
        if (std::holds_alternative<SourceNode>(node)) {
            ids.insert(id);
        }
    }
    return ids;
}

AssetIdSet AssetGraph::outputs() const {
    AssetIdSet ids;
    for (const auto &[id, node] : nodes_) {
        if (std::holds_alternative<GeneratedNode>(node)) {
            ids.insert(id);
        }
    }
    return ids;
}

std::string AssetGraph::serialize() const {
    json nodes = json::array();
    for (const auto &[_, node] : nodes_) {
        nodes.push_back(node_to_json(node));
    }
    json doc = {
        {"version", asset_graph_version},
        {"buildActionsDigest", build_actions_digest_},
        {"nodes", std::move(nodes)},
    };
    return doc.dump();
}

Result<AssetGraph> AssetGraph::deserialize(std::string_view text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected("Malformed asset graph: not a json object");
    }

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer()) {
        return std::unexpected("Malformed asset graph: missing version");
    }
    if (version->get<int>() != asset_graph_version) {
        return std::unexpected(Error(ErrorKind::VersionMismatch,
                                     std::format("Asset graph version {} does not match expected version {}",
                                                 version->get<int>(),
                                                 asset_graph_version)));
    }

    AssetGraph graph;
    try {
        graph.build_actions_digest_ = doc.at("buildActionsDigest").get<std::string>();
        for (const auto &item : doc.at("nodes")) {
            AssetNode node = node_from_json(item);
            AssetId id = node_id(node);
            graph.nodes_.emplace(std::move(id), std::move(node));
        }
    } catch (const std::exception &e) {
        return std::unexpected(std::format("Malformed asset graph: {}", e.what()));
    }
    return graph;
}

} // namespace kiln
