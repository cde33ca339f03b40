#pragma once

#include "config/Config.hpp"

#include <string>

namespace pfs::config {

inline MediaKind parseMediaKind(const std::string& str) {
    if (str == "photos" || str == "photo") return MediaKind::Photos;
    if (str == "videos" || str == "video") return MediaKind::Videos;
    if (str == "all") return MediaKind::All;
    throw ConfigError("Invalid filter kind: " + str);
}

inline std::string mediaKindToString(const MediaKind k) {
    switch (k) {
        case MediaKind::Photos: return "photos";
        case MediaKind::Videos: return "videos";
        case MediaKind::All: return "all";
    }
    return "unknown";
}

// spdlog::level::from_str maps anything unknown to "off"; reject it instead.
inline spdlog::level::level_enum parseLogLevel(const std::string& str) {
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off")
        throw ConfigError("Invalid log level: " + str);
    return lvl;
}

inline std::string logLevelToString(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}
