#include "kiln/build_definition.hpp"
#include "kiln/constants.hpp"
#include "kiln/options.hpp"

#include <filesystem>
#include <iostream>
#include <print>
#include <string>

void print_help() {
    std::println("Usage: kiln [options]");
    std::println("Options:");
    std::println("  -h, --help                    Show this help message");
    std::println("  -v, --version                 Show version");
    std::println("  -d <dir>                      Change working directory before doing anything");
    std::println("  --delete-conflicting-outputs  Delete pre-existing outputs without asking");
    std::println("  --assume-tty                  Prompt about conflicting outputs even without a terminal");
    std::println("  --skip-build-script-check     Keep the cached graph when the manifest changed");
    std::println("  --low-resources               Trade speed for lower memory use in later phases");
    std::println("  --verbose                     Log fine-grained progress");
    std::println("  --no-save                     Do not persist the prepared asset graph");
}

void print_version() {
    std::println("kiln {}", KILN_PROJ_VER);
}

int main(const int argc, const char *const *argv) {
    std::filesystem::path work_dir = ".";
    bool delete_conflicting_outputs = false;
    bool assume_tty = false;
    bool skip_build_script_check = false;
    bool low_resources = false;
    bool verbose = false;
    bool save = true;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            if (i + 1 < argc) {
                work_dir = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for -d");
                return 1;
            }
        } else if (arg == "--delete-conflicting-outputs") {
            delete_conflicting_outputs = true;
        } else if (arg == "--assume-tty") {
            assume_tty = true;
        } else if (arg == "--skip-build-script-check") {
            skip_build_script_check = true;
        } else if (arg == "--low-resources") {
            low_resources = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--no-save") {
            save = false;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    std::error_code ec;
    const std::filesystem::path root_dir = std::filesystem::current_path(ec);
    if (ec) {
        std::println(std::cerr, "Failed to resolve working directory: {}", ec.message());
        return 1;
    }

    auto workspace = kiln::load_workspace(root_dir);
    if (!workspace) {
        std::println(std::cerr, "Failed to load {}: {}", kiln::workspace_manifest, workspace.error().message);
        return 1;
    }

    kiln::BuildOptions options{
        .package_graph = workspace->packages,
        .reader = std::make_shared<kiln::FileBasedAssetReader>(workspace->packages),
        .writer = std::make_shared<kiln::FileBasedAssetWriter>(workspace->packages),
        .logger = kiln::Logger("kiln", std::cerr, verbose ? kiln::LogLevel::Fine : kiln::LogLevel::Info),
        .terminal = kiln::Terminal::standard(),
        .delete_files_by_default = delete_conflicting_outputs,
        .assume_tty = assume_tty,
        .skip_build_script_check = skip_build_script_check,
        .enable_low_resources_mode = low_resources,
    };

    auto definition = kiln::BuildDefinition::prepare_workspace(
        options, std::move(workspace->actions), [&](const kiln::AssetId &id) {
            options.logger.fine("Deleted {}", id);
        });
    if (!definition) {
        std::println(std::cerr, "Failed to prepare workspace: {}", definition.error().message);
        return 1;
    }

    if (definition->from_cache) {
        std::println("{} changes since last build", definition->updates.size());
        for (const auto &[id, change] : definition->updates) {
            std::println("{}: {}", id, change);
        }
    } else {
        std::println("Built new asset graph with {} nodes", definition->asset_graph->all_nodes().size());
    }

    if (save) {
        kiln::AssetGraph &graph = *definition->asset_graph;
        if (auto res = graph.refresh_digests(*options.reader); !res) {
            std::println(std::cerr, "Failed to digest sources: {}", res.error().message);
            return 1;
        }
        const kiln::AssetId graph_id{options.package_graph.root().name, std::string(kiln::asset_graph_path)};
        if (auto res = options.writer->write_as_string(graph_id, graph.serialize()); !res) {
            std::println(std::cerr, "Failed to save asset graph: {}", res.error().message);
            return 1;
        }
    }

    return 0;
}
