#include "kiln/build_action.hpp"

#include "kiln/glob.hpp"

#include <format>

namespace kiln {

namespace {

std::optional<std::string_view> matching_extension(const BuildAction &action, std::string_view path) {
    std::optional<std::string_view> best;
    for (const auto &[ext, _] : action.build_extensions) {
        if (path.ends_with(ext) && path.size() > ext.size() && (!best || ext.size() > best->size())) {
            best = ext;
        }
    }
    return best;
}

std::string normalize_definition(std::string_view name, std::string_view package, char separator) {
    if (name.starts_with(separator)) {
        return std::format("{}{}", package, name);
    }
    if (name.find(separator) == std::string_view::npos) {
        return std::format("{}{}{}", package, separator, name);
    }
    return std::string(name);
}

std::string normalize_usage(std::string_view name, std::string_view package, char separator) {
    if (name.starts_with(separator)) {
        return std::format("{}{}", package, name);
    }
    if (name.find(separator) == std::string_view::npos) {
        return std::format("{}{}{}", name, separator, name);
    }
    return std::string(name);
}

} // namespace

bool BuildAction::matches_input(const AssetId &input) const {
    if (input.package != package || !matching_extension(*this, input.path)) {
        return false;
    }
    if (inputs.empty()) {
        return true;
    }
    for (const auto &pattern : inputs) {
        if (Glob(pattern).matches(input.path)) {
            return true;
        }
    }
    return false;
}

std::vector<AssetId> BuildAction::expected_outputs(const AssetId &input) const {
    std::vector<AssetId> outputs;
    if (!matches_input(input)) {
        return outputs;
    }
    std::string_view ext = *matching_extension(*this, input.path);
    std::string_view stem = std::string_view(input.path).substr(0, input.path.size() - ext.size());
    for (const auto &out_ext : build_extensions.at(std::string(ext))) {
        outputs.push_back({input.package, std::format("{}{}", stem, out_ext)});
    }
    return outputs;
}

Result<Digest> compute_build_actions_digest(const std::vector<BuildAction> &actions) {
    DigestBuilder builder;
    for (const auto &action : actions) {
        nlohmann::json record = {
            {"hide_output", action.hide_output},
            {"package", action.package},
            {"builder", action.builder},
            {"inputs", action.inputs},
            {"build_extensions", action.build_extensions},
        };
        builder.add(record.dump()).add(std::string_view("\0", 1));
    }
    return builder.finish();
}

Result<Digest> compute_builder_options_digest(const nlohmann::json &options) {
    return compute_digest(options.dump());
}

AssetId builder_options_id_for_phase(std::string_view package, size_t phase) {
    return {std::string(package), std::format("Phase{}.builderOptions", phase)};
}

std::string normalize_builder_key_definition(std::string_view builder_key, std::string_view package) {
    return normalize_definition(builder_key, package, '|');
}

std::string normalize_builder_key_usage(std::string_view builder_key, std::string_view package) {
    return normalize_usage(builder_key, package, '|');
}

std::string normalize_target_key_definition(std::string_view target_key, std::string_view package) {
    return normalize_definition(target_key, package, ':');
}

std::string normalize_target_key_usage(std::string_view target_key, std::string_view package) {
    return normalize_usage(target_key, package, ':');
}

} // namespace kiln
