#pragma once

#include "kiln/asset_id.hpp"
#include "kiln/digest.hpp"
#include "kiln/glob.hpp"
#include "kiln/package_graph.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief Read access to assets by id.
 *
 * Implementations must be safe to call from several threads at once; digests
 * for many assets are computed concurrently.
 */
class AssetReader {
public:
    virtual ~AssetReader() = default;

    virtual bool can_read(const AssetId &id) const = 0;
    virtual Result<std::string> read_as_string(const AssetId &id) const = 0;

    /** @brief Content digest of `id`; defaults to hashing `read_as_string`. */
    virtual Result<Digest> digest(const AssetId &id) const;

    /**
     * @brief Lists the assets of one package whose path matches `glob`.
     * @param package The package to search; the root package when omitted.
     * @return The matching ids in path order.
     */
    virtual Result<std::vector<AssetId>> find_assets(const Glob &glob,
                                                     const std::optional<std::string> &package = std::nullopt) const = 0;
};

class AssetWriter {
public:
    virtual ~AssetWriter() = default;

    virtual Result<void> write_as_string(const AssetId &id, std::string_view contents) = 0;

    /** @brief Deletes `id`; deleting an asset that does not exist is not an error. */
    virtual Result<void> remove(const AssetId &id) = 0;
};

/// Deletes one asset on behalf of kiln, e.g. a stale or conflicting output.
using DeleteCallback = std::function<Result<void>(const AssetId &)>;

/** @brief Reads assets from the package directories of a `PackageGraph`. */
class FileBasedAssetReader : public AssetReader {
public:
    explicit FileBasedAssetReader(PackageGraph packages) : packages_(std::move(packages)) {
    }

    bool can_read(const AssetId &id) const override;
    Result<std::string> read_as_string(const AssetId &id) const override;
    Result<Digest> digest(const AssetId &id) const override;
    Result<std::vector<AssetId>> find_assets(const Glob &glob,
                                             const std::optional<std::string> &package = std::nullopt) const override;

private:
    PackageGraph packages_;
};

/** @brief Writes assets into the package directories of a `PackageGraph`. */
class FileBasedAssetWriter : public AssetWriter {
public:
    explicit FileBasedAssetWriter(PackageGraph packages) : packages_(std::move(packages)) {
    }

    Result<void> write_as_string(const AssetId &id, std::string_view contents) override;
    Result<void> remove(const AssetId &id) override;

private:
    PackageGraph packages_;
};

/** @brief Resolves `id` to its on-disk location. */
Result<std::filesystem::path> path_for_asset(const PackageGraph &packages, const AssetId &id);

} // namespace kiln
