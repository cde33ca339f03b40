#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pfs::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (node.IsNull()) {
            rhs.clear();
            return true;
        }
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<FilterConfig> {
    static Node encode(const FilterConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["include"] = mediaKindToString(rhs.include);
        return node;
    }

    static bool decode(const Node& node, FilterConfig& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();
        if (rhs.name.empty() || rhs.name.find('/') != std::string::npos)
            throw ConfigError("Invalid filter name: '" + rhs.name + "'");
        rhs.include = parseMediaKind(node["include"].as<std::string>("all"));
        return true;
    }
};

template<>
struct convert<SourceConfig> {
    static Node encode(const SourceConfig& rhs) {
        Node node;
        node["type"] = rhs.type;
        node["database"] = rhs.database;
        node["date_format"] = rhs.date_format;
        return node;
    }

    static bool decode(const Node& node, SourceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.type = node["type"].as<std::string>("shotwell");
        rhs.database = node["database"].as<std::filesystem::path>(std::filesystem::path{});
        rhs.date_format = node["date_format"].as<std::string>(DEFAULT_DATE_FORMAT);
        return true;
    }
};

template<>
struct convert<FilesystemConfig> {
    static Node encode(const FilesystemConfig& rhs) {
        Node node;
        node["use_symlinks"] = rhs.use_symlinks;
        node["filters"] = rhs.filters;
        return node;
    }

    static bool decode(const Node& node, FilesystemConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.use_symlinks = node["use_symlinks"].as<bool>(false);
        if (const auto filters = node["filters"]) {
            rhs.filters = filters.IsNull() ? std::vector<FilterConfig>{} : filters.as<std::vector<FilterConfig>>();
            for (size_t i = 0; i < rhs.filters.size(); ++i)
                for (size_t j = i + 1; j < rhs.filters.size(); ++j)
                    if (rhs.filters[i].name == rhs.filters[j].name)
                        throw ConfigError("Duplicate filter name: " + rhs.filters[i].name);
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["photofs"] = logLevelToString(rhs.photofs);
        node["fuse"]    = logLevelToString(rhs.fuse);
        node["source"]  = logLevelToString(rhs.source);
        node["fs"]      = logLevelToString(rhs.fs);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.photofs = parseLogLevel(node["photofs"].as<std::string>("info"));
        rhs.fuse = parseLogLevel(node["fuse"].as<std::string>("warn"));
        rhs.source = parseLogLevel(node["source"].as<std::string>("info"));
        rhs.fs = parseLogLevel(node["fs"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = logLevelToString(rhs.console_log_level);
        node["file_log_level"]    = logLevelToString(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = parseLogLevel(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(std::filesystem::path{});
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
