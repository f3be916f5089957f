#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/digest.hpp"
#include "kiln/utility.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief One phase of the build: a builder applied to one package.
 *
 * The position of an action in the ordered action list is its phase index.
 */
struct BuildAction {
    std::string package;
    std::string builder; ///< Normalized builder key, `package|name`.
    std::vector<std::string> inputs; ///< Globs selecting primary inputs; empty selects everything.
    std::map<std::string, std::vector<std::string>> build_extensions; ///< Input suffix -> output suffixes.
    nlohmann::json builder_options = nlohmann::json::object();
    bool hide_output = false;

    /** @brief Whether `input` is a primary input for this action. */
    bool matches_input(const AssetId &input) const;

    /**
     * @brief Returns the outputs this action declares for `input`.
     *
     * Empty if `input` is not a primary input. The longest matching extension wins.
     */
    std::vector<AssetId> expected_outputs(const AssetId &input) const;
};

/**
 * @brief Fingerprint of the structure of the ordered build actions.
 *
 * Covers each action's package, builder, input globs, extensions and
 * visibility. Builder options are left out: those are tracked per phase.
 */
Result<Digest> compute_build_actions_digest(const std::vector<BuildAction> &actions);

Result<Digest> compute_builder_options_digest(const nlohmann::json &options);

/** @brief Id of the node holding the options digest for one phase. */
AssetId builder_options_id_for_phase(std::string_view package, size_t phase);

std::string normalize_builder_key_definition(std::string_view builder_key, std::string_view package);
std::string normalize_builder_key_usage(std::string_view builder_key, std::string_view package);
std::string normalize_target_key_definition(std::string_view target_key, std::string_view package);
std::string normalize_target_key_usage(std::string_view target_key, std::string_view package);

} // namespace kiln
