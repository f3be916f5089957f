#include "kiln/asset_io.hpp"

#include "kiln/mmap.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln {

namespace {

/// Missing paths and dangling links are simply not there; any other failure is an error.
bool is_absent(const std::error_code &ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

Error listing_error(const fs::path &path, const std::error_code &ec) {
    return Error(ErrorKind::Io, std::format("Failed to list {}: {}", path.string(), ec.message()));
}

} // namespace

Result<Digest> AssetReader::digest(const AssetId &id) const {
    auto content = read_as_string(id);
    if (!content) {
        return std::unexpected(content.error());
    }
    return compute_digest(*content);
}

Result<fs::path> path_for_asset(const PackageGraph &packages, const AssetId &id) {
    const PackageNode *package = packages.find(id.package);
    if (!package) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Unknown package for asset: {}", id), {id}));
    }
    return package->path / id.path;
}

bool FileBasedAssetReader::can_read(const AssetId &id) const {
    auto path = path_for_asset(packages_, id);
    if (!path) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(*path, ec);
}

Result<std::string> FileBasedAssetReader::read_as_string(const AssetId &id) const {
    auto path = path_for_asset(packages_, id);
    if (!path) {
        return std::unexpected(path.error());
    }
    try {
        MappedFile file(*path);
        return std::string(file.content());
    } catch (const std::exception &e) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to read {}: {}", id, e.what()), {id}));
    }
}

Result<Digest> FileBasedAssetReader::digest(const AssetId &id) const {
    auto path = path_for_asset(packages_, id);
    if (!path) {
        return std::unexpected(path.error());
    }
    // Hash straight from the mapping, skipping the copy into a string.
    try {
        MappedFile file(*path);
        return compute_digest(file.content());
    } catch (const std::exception &e) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to digest {}: {}", id, e.what()), {id}));
    }
}

Result<std::vector<AssetId>> FileBasedAssetReader::find_assets(const Glob &glob,
                                                               const std::optional<std::string> &package) const {
    const std::string &package_name = package ? *package : packages_.root().name;
    const PackageNode *node = packages_.find(package_name);
    if (!node) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Unknown package: {}", package_name)));
    }

    std::vector<AssetId> found;
    std::error_code ec;

    // Plain file names need no directory walk.
    if (glob.pattern().find_first_of("*?") == std::string::npos) {
        const fs::path file = node->path / glob.pattern();
        const bool regular = fs::is_regular_file(file, ec);
        if (ec && !is_absent(ec)) {
            return std::unexpected(listing_error(file, ec));
        }
        if (regular) {
            found.push_back({package_name, glob.pattern()});
        }
        return found;
    }

    const fs::path start = node->path / glob.literal_prefix();
    const bool listable = fs::is_directory(start, ec);
    if (ec && !is_absent(ec)) {
        return std::unexpected(listing_error(start, ec));
    }
    if (!listable) {
        return found;
    }

    // Unreadable subdirectories fail the listing rather than being skipped.
    fs::recursive_directory_iterator it(start, fs::directory_options::follow_directory_symlink, ec);
    if (ec) {
        return std::unexpected(listing_error(start, ec));
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(listing_error(start, ec));
        }
        std::error_code status_ec;
        const bool regular = it->is_regular_file(status_ec);
        if (status_ec && !is_absent(status_ec)) {
            return std::unexpected(listing_error(it->path(), status_ec));
        }
        if (!regular) {
            continue;
        }
        std::string relative = it->path().lexically_relative(node->path).generic_string();
        if (glob.matches(relative)) {
            found.push_back({package_name, std::move(relative)});
        }
    }
    if (ec) {
        return std::unexpected(listing_error(start, ec));
    }

    std::sort(found.begin(), found.end());
    return found;
}

Result<void> FileBasedAssetWriter::write_as_string(const AssetId &id, std::string_view contents) {
    auto path = path_for_asset(packages_, id);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    fs::create_directories(path->parent_path(), ec);
    if (ec) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to create directory for {}: {}", id, ec.message()), {id}));
    }
    std::ofstream out(*path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to open {} for writing", id), {id}));
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to write {}", id), {id}));
    }
    return {};
}

Result<void> FileBasedAssetWriter::remove(const AssetId &id) {
    auto path = path_for_asset(packages_, id);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    fs::remove(*path, ec);
    if (ec) {
        return std::unexpected(Error(ErrorKind::Io, std::format("Failed to delete {}: {}", id, ec.message()), {id}));
    }
    return {};
}

} // namespace kiln
