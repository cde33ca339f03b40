#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace pfs::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("Configuration root must be a map");

    if (const auto node = root["source"]; node && !YAML::convert<SourceConfig>::decode(node, cfg.source))
        throw ConfigError("source must be a map");
    if (const auto node = root["filesystem"]; node && !YAML::convert<FilesystemConfig>::decode(node, cfg.filesystem))
        throw ConfigError("filesystem must be a map");
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw ConfigError("logging must be a map");

    if (cfg.source.type.empty()) throw ConfigError("source.type must not be empty");
    if (cfg.source.date_format.empty()) cfg.source.date_format = DEFAULT_DATE_FORMAT;

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return fromRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load configuration " + path.string() + ": " + e.what());
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return fromRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["source"] = cfg.source;
    root["filesystem"] = cfg.filesystem;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
