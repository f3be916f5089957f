#pragma once

#include "kiln/asset_io.hpp"
#include "kiln/options.hpp"
#include "kiln/package_graph.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace kiln::testing {

/// A scratch directory holding a root package `app` and a dependency `dep`.
class TempWorkspace {
public:
    TempWorkspace() {
        std::string pattern = (std::filesystem::temp_directory_path() / "kiln-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("Failed to create temporary workspace");
        }
        root_ = pattern;
        std::filesystem::create_directories(dep_dir());
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace &) = delete;
    TempWorkspace &operator=(const TempWorkspace &) = delete;

    const std::filesystem::path &root() const {
        return root_;
    }

    std::filesystem::path dep_dir() const {
        return root_ / "packages" / "dep";
    }

    void write(const std::filesystem::path &relative, const std::string &contents) const {
        const std::filesystem::path path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary | std::ios::trunc) << contents;
    }

    void write_dep(const std::filesystem::path &relative, const std::string &contents) const {
        write(std::filesystem::path("packages") / "dep" / relative, contents);
    }

    bool exists(const std::filesystem::path &relative) const {
        return std::filesystem::exists(root_ / relative);
    }

    PackageGraph packages() const {
        auto graph = PackageGraph::create({.name = "app", .path = root_}, {{.name = "dep", .path = dep_dir()}});
        if (!graph) {
            throw std::runtime_error(graph.error().message);
        }
        return std::move(*graph);
    }

private:
    std::filesystem::path root_;
};

/// Options over a workspace with captured log output and a scripted terminal.
class Session {
public:
    explicit Session(const TempWorkspace &workspace, std::string answers = {}, bool interactive = false)
        : input_(std::move(answers)),
          options{
              .package_graph = workspace.packages(),
              .reader = std::make_shared<FileBasedAssetReader>(workspace.packages()),
              .writer = std::make_shared<FileBasedAssetWriter>(workspace.packages()),
              .logger = Logger("kiln", log_, LogLevel::Fine),
              .terminal = {&input_, &prompt_, interactive},
          } {
    }

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    std::string log() const {
        return log_.str();
    }

    std::string prompt() const {
        return prompt_.str();
    }

private:
    std::ostringstream log_;
    std::istringstream input_;
    std::ostringstream prompt_;

public:
    BuildOptions options;
};

inline BuildAction make_action(std::string package,
                               std::string builder,
                               std::string from,
                               std::vector<std::string> to,
                               bool hide_output = false) {
    BuildAction action;
    action.package = std::move(package);
    action.builder = std::move(builder);
    action.build_extensions[std::move(from)] = std::move(to);
    action.hide_output = hide_output;
    return action;
}

} // namespace kiln::testing
