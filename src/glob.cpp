#include "kiln/glob.hpp"

namespace kiln {

namespace {

bool match_from(std::string_view pattern, std::string_view path) {
    while (!pattern.empty()) {
        if (pattern.starts_with("**")) {
            std::string_view rest = pattern.substr(2);
            // `**/` may also stand for no directory at all.
            if (rest.starts_with('/') && match_from(rest.substr(1), path)) {
                return true;
            }
            for (size_t i = 0; i <= path.size(); ++i) {
                if (match_from(rest, path.substr(i))) {
                    return true;
                }
            }
            return false;
        }

        char c = pattern.front();
        if (c == '*') {
            std::string_view rest = pattern.substr(1);
            for (size_t i = 0; i <= path.size(); ++i) {
                if (match_from(rest, path.substr(i))) {
                    return true;
                }
                if (i < path.size() && path[i] == '/') {
                    break;
                }
            }
            return false;
        }

        if (path.empty()) {
            return false;
        }
        if (c == '?') {
            if (path.front() == '/') {
                return false;
            }
        } else if (c != path.front()) {
            return false;
        }
        pattern.remove_prefix(1);
        path.remove_prefix(1);
    }
    return path.empty();
}

} // namespace

bool Glob::matches(std::string_view path) const {
    return match_from(pattern_, path);
}

std::string_view Glob::literal_prefix() const {
    std::string_view p = pattern_;
    size_t wildcard = p.find_first_of("*?");
    if (wildcard == std::string_view::npos) {
        size_t slash = p.rfind('/');
        return slash == std::string_view::npos ? std::string_view{} : p.substr(0, slash + 1);
    }
    size_t slash = p.rfind('/', wildcard);
    if (slash == std::string_view::npos) {
        return {};
    }
    return p.substr(0, slash + 1);
}

} // namespace kiln
