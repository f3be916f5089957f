#include "kiln/options.hpp"

#include "kiln/constants.hpp"
#include "kiln/mmap.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiln {

using json = nlohmann::json;

Terminal Terminal::standard() {
    bool interactive = isatty(STDIN_FILENO) == 1 && std::getenv("CI") == nullptr;
    return {&std::cin, &std::cout, interactive};
}

namespace {

Result<BuildAction> parse_action(const json &j, std::string_view root_name) {
    BuildAction action;
    action.package = j.value("package", std::string(root_name));
    const std::string builder = j.at("builder").get<std::string>();
    if (builder.empty()) {
        return std::unexpected("Builder key must not be empty");
    }
    action.builder = normalize_builder_key_usage(builder, action.package);
    if (auto it = j.find("inputs"); it != j.end()) {
        action.inputs = it->get<std::vector<std::string>>();
    }
    action.build_extensions = j.at("build_extensions").get<std::map<std::string, std::vector<std::string>>>();
    if (action.build_extensions.empty()) {
        return std::unexpected(std::format("Builder {} declares no build_extensions", action.builder));
    }
    if (auto it = j.find("options"); it != j.end()) {
        action.builder_options = *it;
    }
    action.hide_output = j.value("hide_output", false);
    return action;
}

} // namespace

Result<Workspace> parse_workspace(std::string_view manifest, const fs::path &root_dir) {
    json doc = json::parse(manifest, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(std::format("Malformed {}: not a json object", workspace_manifest));
    }

    try {
        PackageNode root{.name = doc.at("name").get<std::string>(), .path = root_dir};
        std::vector<PackageNode> dependencies;
        if (auto it = doc.find("packages"); it != doc.end()) {
            for (const auto &[name, path] : it->items()) {
                fs::path package_path = path.get<std::string>();
                if (package_path.is_relative()) {
                    package_path = root_dir / package_path;
                }
                dependencies.push_back({.name = name, .path = package_path.lexically_normal()});
            }
        }

        auto packages = PackageGraph::create(std::move(root), std::move(dependencies));
        if (!packages) {
            return std::unexpected(packages.error());
        }

        std::vector<BuildAction> actions;
        if (auto it = doc.find("builders"); it != doc.end()) {
            for (const auto &item : *it) {
                auto action = parse_action(item, packages->root().name);
                if (!action) {
                    return std::unexpected(action.error());
                }
                if (!packages->find(action->package)) {
                    return std::unexpected(Error(ErrorKind::InvalidBuildAction,
                                                 std::format("Builder {} targets unknown package {}",
                                                             action->builder,
                                                             action->package)));
                }
                actions.push_back(std::move(*action));
            }
        }
        return Workspace{std::move(*packages), std::move(actions)};
    } catch (const std::exception &e) {
        return std::unexpected(std::format("Malformed {}: {}", workspace_manifest, e.what()));
    }
}

Result<Workspace> load_workspace(const fs::path &root_dir) {
    const fs::path manifest_path = root_dir / workspace_manifest;
    try {
        MappedFile file(manifest_path);
        return parse_workspace(file.content(), root_dir);
    } catch (const std::exception &e) {
        return std::unexpected(Error(ErrorKind::Io, e.what()));
    }
}

} // namespace kiln
