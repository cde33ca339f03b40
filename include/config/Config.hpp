#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace pfs::config {

constexpr static const auto* DEFAULT_CONFIG_PATH = "/etc/photofs/config.yaml";
constexpr static const auto* DEFAULT_DATE_FORMAT = "%Y-%m-%d, %H.%M";

// Raised for anything that makes startup impossible: unknown source type,
// backend resource that cannot be located, malformed configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class MediaKind {
    Photos,
    Videos,
    All
};

struct FilterConfig {
    std::string name;
    MediaKind include = MediaKind::All;
};

struct SourceConfig {
    std::string type = "shotwell";
    std::filesystem::path database{};       // empty = backend default location
    std::string date_format = DEFAULT_DATE_FORMAT;
};

struct FilesystemConfig {
    bool use_symlinks = false;
    std::vector<FilterConfig> filters = {
        {"Photos", MediaKind::Photos},
        {"Videos", MediaKind::Videos}
    };
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum photofs = spdlog::level::info;   // startup, mount lifecycle
    spdlog::level::level_enum fuse    = spdlog::level::warn;   // per-call tracing at debug
    spdlog::level::level_enum source  = spdlog::level::info;   // backend reloads and failures
    spdlog::level::level_enum fs      = spdlog::level::warn;   // tree construction and path resolution
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};        // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    SourceConfig source;
    FilesystemConfig filesystem;
    LoggingConfig logging;
};

// Loads the YAML file at path. Sections that are absent keep their defaults.
Config loadConfig(const std::filesystem::path& path);

Config parseConfig(const std::string& yaml);

std::string dumpConfig(const Config& cfg);

}
