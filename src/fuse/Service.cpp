#include "fuse/Service.hpp"
#include "fuse/Operations.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdio>
#include <cstdlib>
#include <fuse3/fuse_lowlevel.h>

using namespace pfs::fuse;
using namespace pfs::logging;

Service::Service(Operations& ops) : ops_(ops) {}

int Service::run(fuse_args& args) {
    LogRegistry::fuse()->debug("[Service] Running FUSE service");

    fuse_cmdline_opts opts{};
    if (fuse_parse_cmdline(&args, &opts) != 0) {
        LogRegistry::fuse()->error("[Service] Failed to parse FUSE options");
        return 1;
    }

    if (opts.show_version) {
        std::printf("FUSE library version %s\n", fuse_pkgversion());
        free(opts.mountpoint);
        return 0;
    }

    if (!opts.mountpoint) {
        LogRegistry::fuse()->error("[Service] No mount point specified");
        return 2;
    }

    bind(&ops_);
    const fuse_operations ops = getOperations();

    ::fuse* instance = fuse_new(&args, &ops, sizeof(ops), nullptr);
    if (!instance) {
        LogRegistry::fuse()->error("[Service] Failed to create FUSE instance");
        free(opts.mountpoint);
        return 1;
    }

    if (fuse_mount(instance, opts.mountpoint) != 0) {
        LogRegistry::fuse()->error("[Service] Failed to mount FUSE filesystem at {}", opts.mountpoint);
        fuse_destroy(instance);
        free(opts.mountpoint);
        return 1;
    }

    if (fuse_daemonize(opts.foreground) != 0) {
        LogRegistry::fuse()->error("[Service] Failed to daemonize");
        fuse_unmount(instance);
        fuse_destroy(instance);
        free(opts.mountpoint);
        return 1;
    }

    fuse_session* session = fuse_get_session(instance);
    if (fuse_set_signal_handlers(session) != 0) {
        LogRegistry::fuse()->error("[Service] Failed to set signal handlers");
        fuse_unmount(instance);
        fuse_destroy(instance);
        free(opts.mountpoint);
        return 1;
    }

    LogRegistry::fuse()->info("[Service] Mounted FUSE filesystem at {}", opts.mountpoint);

    int res;
    if (opts.singlethread) {
        res = fuse_loop(instance);
    } else {
        fuse_loop_config config{};
        config.clone_fd = opts.clone_fd;
        config.max_idle_threads = opts.max_idle_threads;
        res = fuse_loop_mt(instance, &config);
    }

    if (res != 0) LogRegistry::fuse()->error("[Service] FUSE loop exited with {}", res);
    LogRegistry::fuse()->info("[Service] FUSE service loop exiting");

    fuse_remove_signal_handlers(session);
    fuse_unmount(instance);
    fuse_destroy(instance);
    free(opts.mountpoint);

    LogRegistry::fuse()->info("[Service] FUSE service stopped successfully");
    return res == 0 ? 0 : 1;
}
