#pragma once

#include "kiln/asset_graph.hpp"
#include "kiln/asset_io.hpp"

#include <memory>
#include <string>

namespace kiln {

/**
 * @brief Where `id` actually lives on disk.
 *
 * Hidden generated outputs are shadowed into the generated output directory
 * of the root package as `<package>/<path>`; everything else stays put.
 */
AssetId cache_location(const AssetId &id, const AssetGraph &graph, const std::string &root_package);

/** @brief Reader that resolves hidden outputs through the generated output directory. */
class BuildCacheReader : public AssetReader {
public:
    BuildCacheReader(std::shared_ptr<const AssetReader> delegate,
                     std::shared_ptr<const AssetGraph> graph,
                     std::string root_package)
        : delegate_(std::move(delegate)), graph_(std::move(graph)), root_package_(std::move(root_package)) {
    }

    bool can_read(const AssetId &id) const override;
    Result<std::string> read_as_string(const AssetId &id) const override;
    Result<Digest> digest(const AssetId &id) const override;
    Result<std::vector<AssetId>> find_assets(const Glob &glob,
                                             const std::optional<std::string> &package = std::nullopt) const override;

private:
    std::shared_ptr<const AssetReader> delegate_;
    std::shared_ptr<const AssetGraph> graph_;
    std::string root_package_;
};

/** @brief Writer that sends hidden outputs to the generated output directory. */
class BuildCacheWriter : public AssetWriter {
public:
    BuildCacheWriter(std::shared_ptr<AssetWriter> delegate,
                     std::shared_ptr<const AssetGraph> graph,
                     std::string root_package)
        : delegate_(std::move(delegate)), graph_(std::move(graph)), root_package_(std::move(root_package)) {
    }

    Result<void> write_as_string(const AssetId &id, std::string_view contents) override;
    Result<void> remove(const AssetId &id) override;

private:
    std::shared_ptr<AssetWriter> delegate_;
    std::shared_ptr<const AssetGraph> graph_;
    std::string root_package_;
};

} // namespace kiln
