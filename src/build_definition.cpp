#include "kiln/build_definition.hpp"

#include "kiln/change_detector.hpp"
#include "kiln/conflict_resolution.hpp"
#include "kiln/graph_loader.hpp"
#include "kiln/source_enumerator.hpp"

#include <format>

namespace kiln {

Result<void> check_build_actions(const std::vector<BuildAction> &actions, const std::string &root_package) {
    for (const auto &action : actions) {
        if (!action.hide_output && action.package != root_package) {
            return std::unexpected(Error(ErrorKind::InvalidBuildAction,
                                         std::format("Invalid builder {} on package {}: only the root package `{}` "
                                                     "may have outputs which are not hidden.",
                                                     action.builder,
                                                     action.package,
                                                     root_package)));
        }
    }
    return {};
}

namespace {

class WorkspaceLoader {
public:
    WorkspaceLoader(const BuildOptions &options, std::vector<BuildAction> actions, OnDelete on_delete)
        : options_(options), actions_(std::move(actions)), on_delete_(std::move(on_delete)),
          logger_(options.logger.child("BuildDefinition")), root_(options.package_graph.root().name) {
    }

    Result<BuildDefinition> prepare_workspace() {
        if (auto res = check_build_actions(actions_, root_); !res) {
            return std::unexpected(res.error());
        }

        logger_.info("Initializing inputs");
        auto sources = find_sources(options_.package_graph, *options_.reader);
        if (!sources) {
            return std::unexpected(sources.error());
        }

        std::shared_ptr<AssetGraph> graph;
        std::optional<BuildScriptUpdates> build_script_updates;
        ChangeMap updates;

        auto cached = try_read_cached_graph(options_, actions_);
        if (cached) {
            graph = std::make_shared<AssetGraph>(std::move(*cached));
        } else {
            logger_.fine("No usable cached asset graph ({})", to_string(cached.error()));
            if (cached.error() == CacheMiss::ActionsChanged) {
                // Phases may mean something else now, so their outputs cannot be kept.
                if (auto res = delete_generated_dir(options_.package_graph); !res) {
                    return std::unexpected(res.error());
                }
            }
        }

        if (graph) {
            auto found = log_timed(logger_, "Checking for updates since last build", [&] {
                return update_asset_graph(graph, *sources);
            });
            if (!found) {
                return std::unexpected(found.error());
            }
            updates = std::move(*found);

            build_script_updates = BuildScriptUpdates::create(options_, *graph);
            if (!options_.skip_build_script_check && build_script_updates->has_been_updated(keys(updates))) {
                logger_.warning("Invalidating asset graph due to build script update");
                if (auto res = delete_generated_dir(options_.package_graph); !res) {
                    return std::unexpected(res.error());
                }
                graph.reset();
                build_script_updates.reset();
                updates.clear();
            }
        }

        const bool from_cache = graph != nullptr;
        if (!graph) {
            AssetIdSet conflicting_outputs;
            auto built = log_timed(logger_, "Building new asset graph", [&]() -> Result<void> {
                auto fresh = AssetGraph::build(
                    actions_, sources->input, sources->internal, options_.package_graph, *options_.reader);
                if (!fresh) {
                    return std::unexpected(fresh.error());
                }
                graph = std::make_shared<AssetGraph>(std::move(*fresh));
                build_script_updates = BuildScriptUpdates::create(options_, *graph);

                AssetIdSet conflicts_in_deps;
                for (const auto &output : graph->outputs()) {
                    if (!sources->input.contains(output)) {
                        continue;
                    }
                    if (output.package == root_) {
                        conflicting_outputs.insert(output);
                    } else {
                        conflicts_in_deps.insert(output);
                    }
                }
                if (!conflicts_in_deps.empty()) {
                    return std::unexpected(unexpected_existing_outputs(conflicts_in_deps));
                }
                return {};
            });
            if (!built) {
                return std::unexpected(built.error());
            }

            // The conflicting files sit in the package itself, never in the cache directory.
            auto cleaned = log_timed(logger_, "Checking for unexpected pre-existing outputs.", [&] {
                return resolve_conflicting_outputs(
                    conflicting_outputs,
                    {.delete_files_by_default = options_.delete_files_by_default, .assume_tty = options_.assume_tty},
                    options_.terminal,
                    logger_,
                    [this](const AssetId &id) { return delete_asset(id, *options_.writer); });
            });
            if (!cleaned) {
                return std::unexpected(cleaned.error());
            }
        }

        BuildDefinition definition;
        definition.asset_graph = graph;
        definition.reader = wrap_reader(graph);
        definition.writer = wrap_writer(graph);
        definition.package_graph = options_.package_graph;
        definition.delete_files_by_default = options_.delete_files_by_default;
        definition.build_script_updates = std::move(build_script_updates);
        definition.enable_low_resources_mode = options_.enable_low_resources_mode;
        definition.on_delete = on_delete_;
        definition.updates = std::move(updates);
        definition.from_cache = from_cache;
        return definition;
    }

private:
    static AssetIdSet keys(const ChangeMap &changes) {
        AssetIdSet ids;
        for (const auto &[id, _] : changes) {
            ids.insert(id);
        }
        return ids;
    }

    /// Diffs the cached graph against disk and applies the result to it.
    Result<ChangeMap> update_asset_graph(const std::shared_ptr<AssetGraph> &graph, const SourceSets &sources) {
        auto updates = detect_changes(*graph, actions_, sources, *options_.reader);
        if (!updates) {
            return std::unexpected(updates.error());
        }

        auto writer = wrap_writer(graph);
        auto reader = wrap_reader(graph);
        auto res = graph->update_and_invalidate(
            actions_, *updates, [this, &writer](const AssetId &id) { return delete_asset(id, *writer); }, *reader);
        if (!res) {
            return std::unexpected(res.error());
        }
        return updates;
    }

    Result<void> delete_asset(const AssetId &id, AssetWriter &writer) {
        if (on_delete_) {
            on_delete_(id);
        }
        return writer.remove(id);
    }

    std::shared_ptr<BuildCacheReader> wrap_reader(const std::shared_ptr<AssetGraph> &graph) const {
        return std::make_shared<BuildCacheReader>(options_.reader, graph, root_);
    }

    std::shared_ptr<BuildCacheWriter> wrap_writer(const std::shared_ptr<AssetGraph> &graph) const {
        return std::make_shared<BuildCacheWriter>(options_.writer, graph, root_);
    }

    const BuildOptions &options_;
    std::vector<BuildAction> actions_;
    OnDelete on_delete_;
    Logger logger_;
    std::string root_;
};

} // namespace

Result<BuildDefinition> BuildDefinition::prepare_workspace(const BuildOptions &options,
                                                           std::vector<BuildAction> actions,
                                                           OnDelete on_delete) {
    return WorkspaceLoader(options, std::move(actions), std::move(on_delete)).prepare_workspace();
}

} // namespace kiln
