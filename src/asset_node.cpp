#include "kiln/asset_node.hpp"

namespace kiln {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

const AssetId &node_id(const AssetNode &node) {
    return std::visit([](const auto &n) -> const AssetId & { return n.id; }, node);
}

std::optional<Digest> &last_known_digest(AssetNode &node) {
    return std::visit([](auto &n) -> std::optional<Digest> & { return n.last_known_digest; }, node);
}

const std::optional<Digest> &last_known_digest(const AssetNode &node) {
    return std::visit([](const auto &n) -> const std::optional<Digest> & { return n.last_known_digest; }, node);
}

bool is_readable(const AssetNode &node) {
    return std::visit(overloaded{
                          [](const SourceNode &) { return true; },
                          [](const InternalNode &) { return true; },
                          [](const GeneratedNode &n) { return n.was_output; },
                          [](const BuilderOptionsNode &) { return false; },
                      },
                      node);
}

bool is_valid_input(const AssetNode &node) {
    return std::holds_alternative<SourceNode>(node) || std::holds_alternative<GeneratedNode>(node);
}

const std::set<AssetId> *primary_outputs(const AssetNode &node) {
    if (const auto *source = std::get_if<SourceNode>(&node)) {
        return &source->primary_outputs;
    }
    if (const auto *generated = std::get_if<GeneratedNode>(&node)) {
        return &generated->primary_outputs;
    }
    return nullptr;
}

std::set<AssetId> *primary_outputs(AssetNode &node) {
    if (auto *source = std::get_if<SourceNode>(&node)) {
        return &source->primary_outputs;
    }
    if (auto *generated = std::get_if<GeneratedNode>(&node)) {
        return &generated->primary_outputs;
    }
    return nullptr;
}

} // namespace kiln
