#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace kiln {

/**
 * @brief Identifies a single asset: a path inside a package.
 *
 * Two ids are equal iff both the package and the path match exactly.
 */
struct AssetId {
    std::string package;
    std::string path;

    /** @brief Returns the `package|path` form. */
    std::string to_string() const;

    /**
     * @brief Parses the `package|path` form.
     * @return The id, or nullopt if the separator or either component is missing.
     */
    static std::optional<AssetId> parse(std::string_view text);

    bool operator==(const AssetId &) const = default;
    auto operator<=>(const AssetId &) const = default;
};

enum class ChangeType { Added, Removed, Modified };

std::string_view to_string(ChangeType type);

struct AssetIdHash {
    size_t operator()(const AssetId &id) const noexcept;
};

using AssetIdSet = std::unordered_set<AssetId, AssetIdHash>;

/// Later writes for the same id override earlier ones.
using ChangeMap = std::map<AssetId, ChangeType>;

} // namespace kiln

template <>
struct std::hash<kiln::AssetId> : kiln::AssetIdHash {};

template <>
struct std::formatter<kiln::AssetId> : std::formatter<std::string_view> {
    auto format(const kiln::AssetId &id, std::format_context &ctx) const {
        return std::formatter<std::string_view>::format(id.to_string(), ctx);
    }
};

template <>
struct std::formatter<kiln::ChangeType> : std::formatter<std::string_view> {
    auto format(kiln::ChangeType type, std::format_context &ctx) const {
        return std::formatter<std::string_view>::format(kiln::to_string(type), ctx);
    }
};
