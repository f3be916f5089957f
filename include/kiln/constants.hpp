#pragma once

#include <array>
#include <string_view>

namespace kiln {

/// Root-package relative directory owned by kiln.
inline constexpr std::string_view cache_dir = ".kiln";
inline constexpr std::string_view asset_graph_path = ".kiln/asset_graph.json";
/// Hidden outputs live here as `<package>/<path>`.
inline constexpr std::string_view generated_output_directory = ".kiln/generated";
inline constexpr std::string_view entry_point_dir = ".kiln/entrypoint";

inline constexpr std::string_view workspace_manifest = "kiln.json";

inline constexpr std::array<std::string_view, 9> root_package_files_allowlist = {
    "benchmark/**", "bin/**", "example/**", "lib/**", "test/**", "tool/**", "web/**", "kiln.json", "kiln.lock",
};

inline constexpr std::string_view sdk_package = "$sdk";
inline constexpr std::string_view sdk_package_include = "lib/dev_compiler/**.js";
inline constexpr std::string_view dependency_package_include = "lib/**";

/// Bump whenever the serialized asset graph layout changes incompatibly.
inline constexpr int asset_graph_version = 3;

} // namespace kiln
