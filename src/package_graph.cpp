#include "kiln/package_graph.hpp"

#include <format>

namespace kiln {

Result<PackageGraph> PackageGraph::create(PackageNode root, std::vector<PackageNode> dependencies) {
    if (root.name.empty()) {
        return std::unexpected("Root package has no name");
    }

    PackageGraph graph;
    graph.root_name_ = root.name;
    root.is_root = true;
    for (const auto &dep : dependencies) {
        root.dependencies.push_back(dep.name);
    }
    graph.packages_.emplace(root.name, std::make_shared<PackageNode>(std::move(root)));

    for (auto &dep : dependencies) {
        if (dep.name.empty()) {
            return std::unexpected("Dependency package has no name");
        }
        dep.is_root = false;
        std::string name = dep.name;
        auto [_, inserted] = graph.packages_.emplace(name, std::make_shared<PackageNode>(std::move(dep)));
        if (!inserted) {
            return std::unexpected(std::format("Duplicate package: {}", name));
        }
    }
    return graph;
}

const PackageNode *PackageGraph::find(const std::string &name) const {
    if (auto it = packages_.find(name); it != packages_.end()) {
        return it->second.get();
    }
    return nullptr;
}

} // namespace kiln
