// Filesystem
#include "fuse/Service.hpp"
#include "fuse/Operations.hpp"
#include "fs/Resolver.hpp"

// Sources
#include "source/ImageSource.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <vector>
#include <fuse3/fuse_lowlevel.h>

using namespace pfs::config;
using namespace pfs::source;
using namespace pfs::fuse;
using namespace pfs::logging;

namespace {

struct Options {
    char* config{nullptr};
    char* source{nullptr};
    char* database{nullptr};
    char* photoPath{nullptr};
    char* videoPath{nullptr};
    char* dateFormat{nullptr};
    int symlinks{0};
    int listSources{0};
    int showHelp{0};

    ~Options() {
        for (auto* s : {config, source, database, photoPath, videoPath, dateFormat}) free(s);
    }
};

#define PFS_OPT(t, p) { t, offsetof(Options, p), 1 }

const fuse_opt optionSpec[] = {
    PFS_OPT("--config=%s", config),
    PFS_OPT("--source=%s", source),
    PFS_OPT("--database=%s", database),
    PFS_OPT("--photo-path=%s", photoPath),
    PFS_OPT("--video-path=%s", videoPath),
    PFS_OPT("--date-format=%s", dateFormat),
    PFS_OPT("--symlinks", symlinks),
    PFS_OPT("--list-sources", listSources),
    PFS_OPT("-h", showHelp),
    PFS_OPT("--help", showHelp),
    FUSE_OPT_END
};

void printUsage(const char* progname) {
    std::printf("usage: %s [options] <mountpoint>\n\n"
                "photofs options:\n"
                "    --config=<path>        configuration file (default %s)\n"
                "    --source=<name>        image source to use (see --list-sources)\n"
                "    --database=<path>      catalogue database, overriding the source default\n"
                "    --photo-path=<name>    directory name of the photo view\n"
                "    --video-path=<name>    directory name of the video view\n"
                "    --date-format=<fmt>    strftime format naming untitled media\n"
                "    --symlinks             present media as symbolic links\n"
                "    --list-sources         print the available image sources and exit\n\n",
                progname, DEFAULT_CONFIG_PATH);
}

// Renames the first view of the given kind, or adds one.
void nameView(FilesystemConfig& fs, const MediaKind kind, const std::string& name) {
    for (auto& f : fs.filters)
        if (f.include == kind) {
            f.name = name;
            return;
        }
    fs.filters.push_back({name, kind});
}

Config buildConfig(const Options& opts) {
    Config cfg;
    if (opts.config) cfg = loadConfig(opts.config);
    else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) cfg = loadConfig(DEFAULT_CONFIG_PATH);

    if (opts.source) cfg.source.type = opts.source;
    if (opts.database) cfg.source.database = opts.database;
    if (opts.dateFormat && *opts.dateFormat) cfg.source.date_format = opts.dateFormat;
    if (opts.symlinks) cfg.filesystem.use_symlinks = true;
    if (opts.photoPath) nameView(cfg.filesystem, MediaKind::Photos, opts.photoPath);
    if (opts.videoPath) nameView(cfg.filesystem, MediaKind::Videos, opts.videoPath);

    return cfg;
}

}

int main(int argc, char* argv[]) {
    fuse_args args = FUSE_ARGS_INIT(argc, argv);
    Options opts;

    if (fuse_opt_parse(&args, &opts, optionSpec, nullptr) == -1) {
        std::cerr << "Failed to parse command line" << std::endl;
        return EXIT_FAILURE;
    }

    if (opts.showHelp) {
        printUsage(argv[0]);
        fuse_cmdline_help();
        fuse_lib_help(&args);
        fuse_opt_free_args(&args);
        return EXIT_SUCCESS;
    }

    int status = EXIT_FAILURE;
    try {
        ConfigRegistry::init(buildConfig(opts));
        const auto& cfg = ConfigRegistry::get();
        LogRegistry::init(cfg.logging.log_dir);

        registerBuiltinSources();

        if (opts.listSources) {
            for (const auto& name : ImageSource::names()) std::cout << name << std::endl;
            fuse_opt_free_args(&args);
            return EXIT_SUCCESS;
        }

        LogRegistry::photofs()->info("[*] Initializing {} source...", cfg.source.type);
        const auto source = ImageSource::get(cfg.source.type)(cfg.source);
        source->refresh();

        std::vector<pfs::fs::Filter> filters;
        for (const auto& f : cfg.filesystem.filters) filters.push_back(pfs::fs::Filter::fromConfig(f));

        Operations ops(*source,
                       pfs::fs::Resolver(*source, std::move(filters)),
                       Operations::referenceStat(source->referencePath()),
                       cfg.filesystem.use_symlinks);

        LogRegistry::photofs()->info("[✓] Source loaded, mounting...");
        status = Service(ops).run(args);
        LogRegistry::photofs()->info("[*] photofs exiting with status {}", status);
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::photofs()->error("[-] Failed to start photofs: {}", e.what());
        else std::cerr << "Failed to start photofs: " << e.what() << std::endl;
        status = EXIT_FAILURE;
    }

    fuse_opt_free_args(&args);
    return status;
}
