#pragma once

#include "kiln/asset_io.hpp"
#include "kiln/build_action.hpp"
#include "kiln/logging.hpp"
#include "kiln/package_graph.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

namespace kiln {

/** @brief Where interactive prompts are read from and written to. */
struct Terminal {
    std::istream *in;
    std::ostream *out;
    bool interactive = false;

    /** @brief stdin/stdout, interactive when stdin is a tty and `CI` is unset. */
    static Terminal standard();
};

/** @brief Everything one preparation pass needs besides the build actions. */
struct BuildOptions {
    PackageGraph package_graph;
    std::shared_ptr<AssetReader> reader;
    std::shared_ptr<AssetWriter> writer;
    Logger logger;
    Terminal terminal;
    bool delete_files_by_default = false; ///< Delete conflicting outputs without asking.
    bool assume_tty = false;              ///< Prompt even when the terminal does not look interactive.
    bool skip_build_script_check = false;
    bool enable_low_resources_mode = false;
};

/** @brief The contents of a workspace manifest. */
struct Workspace {
    PackageGraph packages;
    std::vector<BuildAction> actions;
};

/**
 * @brief Parses a `kiln.json` manifest.
 *
 * Relative package paths are resolved against `root_dir`; builder keys are normalized.
 *
 * @param manifest The manifest text.
 * @param root_dir Directory of the root package.
 * @return The workspace, or an error describing the first malformed entry.
 */
Result<Workspace> parse_workspace(std::string_view manifest, const std::filesystem::path &root_dir);

/** @brief Reads and parses `<root_dir>/kiln.json`. */
Result<Workspace> load_workspace(const std::filesystem::path &root_dir);

} // namespace kiln
