#pragma once

#include <string>
#include <string_view>

namespace kiln {

/**
 * @brief Matches `/`-separated relative paths against a glob pattern.
 *
 * Supported syntax: `*` (any run of characters except `/`), `**` (any run of
 * characters including `/`; `**` followed by `/` also matches zero
 * directories), `?` (one character except `/`), and literal characters.
 */
class Glob {
public:
    explicit Glob(std::string pattern) : pattern_(std::move(pattern)) {
    }

    bool matches(std::string_view path) const;

    /**
     * @brief Returns the literal directory prefix of the pattern.
     *
     * Used to avoid walking directories that can never match, e.g. `lib/` for `lib/**`.
     */
    std::string_view literal_prefix() const;

    const std::string &pattern() const {
        return pattern_;
    }

private:
    std::string pattern_;
};

} // namespace kiln
