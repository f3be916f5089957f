#include "kiln/asset_id.hpp"

namespace kiln {

std::string AssetId::to_string() const {
    return std::format("{}|{}", package, path);
}

std::optional<AssetId> AssetId::parse(std::string_view text) {
    size_t pipe = text.find('|');
    if (pipe == std::string_view::npos || pipe == 0 || pipe + 1 == text.size()) {
        return std::nullopt;
    }
    return AssetId{std::string(text.substr(0, pipe)), std::string(text.substr(pipe + 1))};
}

std::string_view to_string(ChangeType type) {
    switch (type) {
    case ChangeType::Added:
        return "added";
    case ChangeType::Removed:
        return "removed";
    case ChangeType::Modified:
        return "modified";
    }
    return "unknown";
}

size_t AssetIdHash::operator()(const AssetId &id) const noexcept {
    size_t h = std::hash<std::string>{}(id.package);
    // boost::hash_combine mixing
    h ^= std::hash<std::string>{}(id.path) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

} // namespace kiln
