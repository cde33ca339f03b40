#include "fuse/Bridge.hpp"
#include "fuse/Operations.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

using namespace pfs::logging;

namespace pfs::fuse {

static Operations* operations = nullptr;

void bind(Operations* ops) {
    operations = ops;
}

int getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) {
    (void)fi;
    std::memset(stbuf, 0, sizeof(struct stat));
    return operations->getattr(path, stbuf);
}

int readdir(const char* path, void* buf, const fuse_fill_dir_t filler, const off_t offset, fuse_file_info* fi,
            const fuse_readdir_flags flags) {
    (void)offset;
    (void)fi;
    (void)flags;

    std::vector<std::string> names;
    if (const int res = operations->readdir(path, names); res < 0) return res;

    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    for (const auto& name : names)
        if (filler(buf, name.c_str(), nullptr, 0, static_cast<fuse_fill_dir_flags>(0)) != 0) {
            LogRegistry::fuse()->warn("[readdir] Buffer full while listing {}", path);
            break;
        }

    return 0;
}

int readlink(const char* path, char* buf, const size_t size) {
    if (size == 0) return -EINVAL;

    std::string target;
    if (const int res = operations->readlink(path, target); res < 0) return res;

    // libfuse expects a terminated string, truncated to fit
    const auto n = std::min(target.size(), size - 1);
    std::memcpy(buf, target.data(), n);
    buf[n] = '\0';
    return 0;
}

int open(const char* path, fuse_file_info* fi) {
    uint64_t handle = 0;
    if (const int res = operations->open(path, fi->flags, handle); res < 0) return res;
    fi->fh = handle;
    fi->keep_cache = 1;
    return 0;
}

int read(const char* path, char* buf, const size_t size, const off_t offset, fuse_file_info* fi) {
    (void)path;
    return operations->read(fi->fh, buf, size, offset);
}

int release(const char* path, fuse_file_info* fi) {
    (void)path;
    return operations->release(fi->fh);
}

int statfs(const char* path, struct statvfs* stbuf) {
    std::memset(stbuf, 0, sizeof(struct statvfs));
    return operations->statfs(path, stbuf);
}

void* init(fuse_conn_info* conn, fuse_config* cfg) {
    LogRegistry::fuse()->debug("[init] Initializing FUSE connection...");

    conn->want |= FUSE_CAP_ASYNC_READ;

    // Paths are resolved per call; inode numbers carry no meaning
    cfg->use_ino = 0;
    cfg->nullpath_ok = 1;
    cfg->kernel_cache = 0;

    return operations;
}

void destroy(void* private_data) {
    (void)private_data;
    if (operations) operations->destroy();
}

fuse_operations getOperations() {
    fuse_operations ops = {};
    ops.getattr = getattr;
    ops.readdir = readdir;
    ops.readlink = readlink;
    ops.open = open;
    ops.read = read;
    ops.release = release;
    ops.statfs = statfs;
    ops.init = init;
    ops.destroy = destroy;
    return ops;
}

}
