#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pfs::util {

inline void requireAbsolute(const std::string_view path) {
    if (path.empty() || path.front() != '/')
        throw std::invalid_argument("\"" + std::string(path) + "\" does not begin with \"/\"");
}

// "/Tag/Other/Third" -> {"Tag", "Other", "Third"}; "/" -> {}. Empty segments are skipped.
inline std::vector<std::string> breakPath(const std::string_view path) {
    requireAbsolute(path);

    std::vector<std::string> segments;
    size_t pos = 1;
    while (pos <= path.size()) {
        const auto next = std::min(path.find('/', pos), path.size());
        if (next > pos) segments.emplace_back(path.substr(pos, next - pos));
        pos = next + 1;
    }
    return segments;
}

// "/Photos/A/B" -> {"Photos", "/A/B"}; "/Photos" -> {"Photos", ""}; "/" -> {"", ""}.
inline std::pair<std::string, std::string> splitPath(const std::string_view path) {
    requireAbsolute(path);

    const auto rest = path.substr(1);
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) return {std::string(rest), {}};
    return {std::string(rest.substr(0, slash)), std::string(rest.substr(slash))};
}

}
