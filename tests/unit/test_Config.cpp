#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace pfs::config;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = parseConfig("");
    EXPECT_EQ(cfg.source.type, "shotwell");
    EXPECT_TRUE(cfg.source.database.empty());
    EXPECT_EQ(cfg.source.date_format, DEFAULT_DATE_FORMAT);
    EXPECT_FALSE(cfg.filesystem.use_symlinks);
    ASSERT_EQ(cfg.filesystem.filters.size(), 2u);
    EXPECT_EQ(cfg.filesystem.filters[0].name, "Photos");
    EXPECT_EQ(cfg.filesystem.filters[0].include, MediaKind::Photos);
    EXPECT_EQ(cfg.filesystem.filters[1].name, "Videos");
    EXPECT_EQ(cfg.filesystem.filters[1].include, MediaKind::Videos);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST(ConfigTest, FullDocument) {
    const auto cfg = parseConfig(R"(
source:
  type: shotwell
  database: /home/me/.local/share/shotwell/data/photo.db
  date_format: "%Y"
filesystem:
  use_symlinks: true
  filters:
    - { name: Pictures, include: photos }
    - { name: Everything, include: all }
logging:
  log_dir: /var/log/photofs
  levels:
    console_log_level: debug
    file_log_level: error
    subsystem_levels: { photofs: info, fuse: debug, source: warn, fs: trace }
)");

    EXPECT_EQ(cfg.source.database, "/home/me/.local/share/shotwell/data/photo.db");
    EXPECT_EQ(cfg.source.date_format, "%Y");
    EXPECT_TRUE(cfg.filesystem.use_symlinks);
    ASSERT_EQ(cfg.filesystem.filters.size(), 2u);
    EXPECT_EQ(cfg.filesystem.filters[0].name, "Pictures");
    EXPECT_EQ(cfg.filesystem.filters[1].include, MediaKind::All);
    EXPECT_EQ(cfg.logging.log_dir, "/var/log/photofs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fuse, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::trace);
}

TEST(ConfigTest, EmptyFilterListDisablesViews) {
    const auto cfg = parseConfig("filesystem:\n  filters: []\n");
    EXPECT_TRUE(cfg.filesystem.filters.empty());

    const auto nulled = parseConfig("filesystem:\n  filters:\n");
    EXPECT_TRUE(nulled.filesystem.filters.empty());
}

TEST(ConfigTest, EmptyDateFormatFallsBack) {
    EXPECT_EQ(parseConfig("source:\n  date_format: \"\"\n").source.date_format, DEFAULT_DATE_FORMAT);
}

TEST(ConfigTest, InvalidValuesAreConfigErrors) {
    EXPECT_THROW(parseConfig("filesystem:\n  filters:\n    - { name: X, include: music }\n"), ConfigError);
    EXPECT_THROW(parseConfig("filesystem:\n  filters:\n    - { name: A/B }\n"), ConfigError);
    EXPECT_THROW(parseConfig("filesystem:\n  filters:\n    - { name: A }\n    - { name: A }\n"), ConfigError);
    EXPECT_THROW(parseConfig("logging:\n  levels:\n    console_log_level: loud\n"), ConfigError);
    EXPECT_THROW(parseConfig("source:\n  type: \"\"\n"), ConfigError);
    EXPECT_THROW(parseConfig("source: [1, 2]\n"), ConfigError);
    EXPECT_THROW(parseConfig("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(parseConfig("source: {type: [unclosed\n"), ConfigError);
}

TEST(ConfigTest, DumpedConfigParsesBack) {
    Config cfg;
    cfg.source.database = "/tmp/photo.db";
    cfg.filesystem.use_symlinks = true;
    cfg.filesystem.filters = {{"Only", MediaKind::Videos}};

    const auto again = parseConfig(dumpConfig(cfg));
    EXPECT_EQ(again.source.database, "/tmp/photo.db");
    EXPECT_TRUE(again.filesystem.use_symlinks);
    ASSERT_EQ(again.filesystem.filters.size(), 1u);
    EXPECT_EQ(again.filesystem.filters[0].include, MediaKind::Videos);
}

TEST(ConfigTest, LoadFromFile) {
    const auto path = fs::temp_directory_path() / ("photofs-config-" + std::to_string(::getpid()) + ".yaml");
    std::ofstream(path) << "source:\n  type: shotwell\n  database: /srv/photo.db\n";

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.source.database, "/srv/photo.db");
    fs::remove(path);

    EXPECT_THROW(loadConfig(path), ConfigError);
}

TEST(ConfigTest, RegistryIsInitializedForTests) {
    EXPECT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().source.type, "shotwell");
}
