#include "kiln/source_enumerator.hpp"

#include "kiln/constants.hpp"
#include "kiln/worker_pool.hpp"

#include <format>

namespace kiln {

AssetIdSet SourceSets::all() const {
    AssetIdSet result = input;
    result.insert(cache_dir.begin(), cache_dir.end());
    result.insert(internal.begin(), internal.end());
    return result;
}

std::vector<std::string> package_includes(const PackageNode &package) {
    if (package.is_root) {
        return {root_package_files_allowlist.begin(), root_package_files_allowlist.end()};
    }
    if (package.name == sdk_package) {
        return {std::string(sdk_package_include)};
    }
    return {std::string(dependency_package_include)};
}

Result<AssetIdSet> find_input_sources(const PackageGraph &packages, const AssetReader &reader) {
    std::vector<const PackageNode *> nodes;
    nodes.reserve(packages.all_packages().size());
    for (const auto &[name, package] : packages.all_packages()) {
        nodes.push_back(package.get());
    }

    std::vector<Result<std::vector<AssetId>>> listings(nodes.size());
    run_parallel(nodes.size(), [&](size_t i) {
        std::vector<AssetId> ids;
        for (const auto &pattern : package_includes(*nodes[i])) {
            auto found = reader.find_assets(Glob(pattern), nodes[i]->name);
            if (!found) {
                listings[i] = std::unexpected(std::move(found.error()));
                return;
            }
            ids.insert(ids.end(), std::make_move_iterator(found->begin()), std::make_move_iterator(found->end()));
        }
        listings[i] = std::move(ids);
    });

    // Every listing has finished; a package that cannot be listed fails the whole enumeration.
    AssetIdSet sources;
    for (auto &listing : listings) {
        if (!listing) {
            return std::unexpected(std::move(listing.error()));
        }
        sources.insert(std::make_move_iterator(listing->begin()), std::make_move_iterator(listing->end()));
    }
    return sources;
}

Result<AssetIdSet> find_cache_dir_sources(const AssetReader &reader) {
    auto found = reader.find_assets(Glob(std::format("{}/**", generated_output_directory)));
    if (!found) {
        return std::unexpected(found.error());
    }

    AssetIdSet sources;
    for (const auto &id : *found) {
        // <generated_output_directory>/<package>/<path>
        std::string_view package_path = std::string_view(id.path).substr(generated_output_directory.size() + 1);
        size_t slash = package_path.find('/');
        if (slash == std::string_view::npos || slash == 0 || slash + 1 == package_path.size()) {
            return std::unexpected(Error(ErrorKind::Io,
                                         std::format("Unexpected file in generated output directory: {}", id),
                                         {id}));
        }
        sources.insert({std::string(package_path.substr(0, slash)), std::string(package_path.substr(slash + 1))});
    }
    return sources;
}

Result<AssetIdSet> find_internal_sources(const AssetReader &reader) {
    auto found = reader.find_assets(Glob(std::format("{}/**", entry_point_dir)));
    if (!found) {
        return std::unexpected(found.error());
    }
    return AssetIdSet(found->begin(), found->end());
}

Result<SourceSets> find_sources(const PackageGraph &packages, const AssetReader &reader) {
    SourceSets sources;
    auto input = find_input_sources(packages, reader);
    if (!input) {
        return std::unexpected(input.error());
    }
    sources.input = std::move(*input);

    auto cache_dir = find_cache_dir_sources(reader);
    if (!cache_dir) {
        return std::unexpected(cache_dir.error());
    }
    sources.cache_dir = std::move(*cache_dir);

    auto internal = find_internal_sources(reader);
    if (!internal) {
        return std::unexpected(internal.error());
    }
    sources.internal = std::move(*internal);
    return sources;
}

} // namespace kiln
