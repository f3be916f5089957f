#include "kiln/graph_loader.hpp"

#include "kiln/constants.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace kiln {

std::string_view to_string(CacheMiss miss) {
    switch (miss) {
    case CacheMiss::Absent:
        return "absent";
    case CacheMiss::VersionMismatch:
        return "version mismatch";
    case CacheMiss::ActionsChanged:
        return "build actions changed";
    case CacheMiss::Unreadable:
        return "unreadable";
    }
    return "unknown";
}

Result<void> delete_generated_dir(const PackageGraph &packages) {
    const fs::path generated_dir = packages.root().path / generated_output_directory;
    std::error_code ec;
    fs::remove_all(generated_dir, ec);
    if (ec) {
        return std::unexpected(
            Error(ErrorKind::Io, std::format("Failed to delete {}: {}", generated_dir.string(), ec.message())));
    }
    return {};
}

std::expected<AssetGraph, CacheMiss> try_read_cached_graph(const BuildOptions &options,
                                                           const std::vector<BuildAction> &actions) {
    const Logger &logger = options.logger;
    const AssetId graph_id{options.package_graph.root().name, std::string(asset_graph_path)};
    if (!options.reader->can_read(graph_id)) {
        return std::unexpected(CacheMiss::Absent);
    }

    return log_timed(logger, "Reading cached asset graph", [&]() -> std::expected<AssetGraph, CacheMiss> {
        auto text = options.reader->read_as_string(graph_id);
        if (!text) {
            logger.warning("Failed to read cached asset graph, starting fresh: {}", text.error().message);
            return std::unexpected(CacheMiss::Unreadable);
        }

        auto cached = AssetGraph::deserialize(*text);
        if (!cached) {
            if (cached.error().kind == ErrorKind::VersionMismatch) {
                // Old graph versions are never migrated.
                logger.warning("Throwing away cached asset graph due to version mismatch.");
                if (auto res = delete_generated_dir(options.package_graph); !res) {
                    logger.warning("{}", res.error().message);
                }
                return std::unexpected(CacheMiss::VersionMismatch);
            }
            logger.warning("Failed to parse cached asset graph, starting fresh: {}", cached.error().message);
            return std::unexpected(CacheMiss::Unreadable);
        }

        auto current = compute_build_actions_digest(actions);
        if (!current || *current != cached->build_actions_digest()) {
            logger.warning("Throwing away cached asset graph because the build actions have changed. This could "
                           "happen as a result of adding a new dependency, or if you are using a build script "
                           "which changes the build structure based on command line flags or other configuration.");
            return std::unexpected(CacheMiss::ActionsChanged);
        }
        return std::move(*cached);
    });
}

} // namespace kiln
