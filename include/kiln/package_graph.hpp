#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kiln {

/** @brief A package known to the build and where it lives on disk. */
struct PackageNode {
    std::string name;
    std::filesystem::path path;
    bool is_root = false;
    std::vector<std::string> dependencies;
};

/**
 * @brief All packages visible to one build, keyed by name.
 *
 * Exactly one package is the root package.
 */
class PackageGraph {
public:
    /**
     * @brief Creates a graph from a root package and its dependencies.
     * @return The graph, or an error on a missing/duplicate package name.
     */
    static Result<PackageGraph> create(PackageNode root, std::vector<PackageNode> dependencies);

    const PackageNode &root() const {
        return *packages_.at(root_name_);
    }

    /** @brief Returns the package named `name`, or nullptr. */
    const PackageNode *find(const std::string &name) const;

    const std::map<std::string, std::shared_ptr<PackageNode>> &all_packages() const {
        return packages_;
    }

private:
    std::string root_name_;
    std::map<std::string, std::shared_ptr<PackageNode>> packages_;
};

} // namespace kiln
