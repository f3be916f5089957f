#include "kiln/build_cache.hpp"

#include "kiln/constants.hpp"

#include <format>

namespace kiln {

AssetId cache_location(const AssetId &id, const AssetGraph &graph, const std::string &root_package) {
    const auto *generated = std::get_if<GeneratedNode>(graph.get(id));
    if (!generated || !generated->is_hidden) {
        return id;
    }
    return {root_package, std::format("{}/{}/{}", generated_output_directory, id.package, id.path)};
}

bool BuildCacheReader::can_read(const AssetId &id) const {
    return delegate_->can_read(cache_location(id, *graph_, root_package_));
}

Result<std::string> BuildCacheReader::read_as_string(const AssetId &id) const {
    return delegate_->read_as_string(cache_location(id, *graph_, root_package_));
}

Result<Digest> BuildCacheReader::digest(const AssetId &id) const {
    return delegate_->digest(cache_location(id, *graph_, root_package_));
}

Result<std::vector<AssetId>> BuildCacheReader::find_assets(const Glob &glob,
                                                           const std::optional<std::string> &package) const {
    return delegate_->find_assets(glob, package);
}

Result<void> BuildCacheWriter::write_as_string(const AssetId &id, std::string_view contents) {
    return delegate_->write_as_string(cache_location(id, *graph_, root_package_), contents);
}

Result<void> BuildCacheWriter::remove(const AssetId &id) {
    return delegate_->remove(cache_location(id, *graph_, root_package_));
}

} // namespace kiln
