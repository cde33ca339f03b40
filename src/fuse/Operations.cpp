#include "fuse/Operations.hpp"
#include "source/ImageSource.hpp"
#include "fs/model/Image.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <mutex>
#include <system_error>
#include <unistd.h>

using namespace pfs::fuse;
using namespace pfs::fs;
using namespace pfs::logging;

namespace {

constexpr mode_t WRITE_BITS = S_IWUSR | S_IWGRP | S_IWOTH;

int errnoOf(const std::system_error& e) {
    return e.code().value() ? -e.code().value() : -EIO;
}

}

Operations::Operations(source::ImageSource& source, Resolver resolver, const struct stat& dirStat, const bool useSymlinks)
    : source_(source), resolver_(std::move(resolver)), dirStat_(dirStat), useSymlinks_(useSymlinks) {
    dirStat_.st_mode = S_IFDIR | (dirStat_.st_mode & 07777 & ~WRITE_BITS);
}

struct stat Operations::referenceStat(const std::filesystem::path& dir) {
    struct stat st{};
    if (!dir.empty() && ::lstat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) return st;

    LogRegistry::fuse()->warn("[Operations] Cannot use '{}' for directory attributes, using defaults", dir.string());
    st = {};
    st.st_mode = S_IFDIR | 0555;
    st.st_nlink = 2;
    st.st_uid = ::getuid();
    st.st_gid = ::getgid();
    st.st_atime = st.st_mtime = st.st_ctime = ::time(nullptr);
    return st;
}

std::optional<Resolution> Operations::resolve(const char* op, const char* path, int& err) {
    try {
        source_.refresh();
    } catch (const std::exception& e) {
        LogRegistry::fuse()->error("[{}] Failed to refresh image source for {}: {}", op, path, e.what());
        err = -EIO;
        return std::nullopt;
    }

    try {
        auto res = resolver_.locate(path);
        if (!res) {
            LogRegistry::fuse()->debug("[{}] No entry for path: {}", op, path);
            err = -ENOENT;
        }
        return res;
    } catch (const std::invalid_argument& e) {
        LogRegistry::fuse()->error("[{}] Malformed path {}: {}", op, path, e.what());
        err = -EINVAL;
        return std::nullopt;
    }
}

int Operations::getattr(const char* path, struct stat* st) {
    LogRegistry::fuse()->debug("[getattr] Called for path: {}", path);

    int err = 0;
    const auto res = resolve("getattr", path, err);
    if (!res) return err;

    if (res->node.isDirectory()) {
        *st = dirStat_;
        return 0;
    }

    const auto* image = res->node.image;
    try {
        *st = image->stat();
    } catch (const std::system_error& e) {
        LogRegistry::fuse()->warn("[getattr] {}: {}", path, e.what());
        return errnoOf(e);
    }

    // The mount is read-only whatever the file allows
    st->st_mode &= ~WRITE_BITS;

    if (useSymlinks_) {
        st->st_mode = S_IFLNK | (st->st_mode & 07777);
        st->st_size = static_cast<off_t>(image->location().string().size());
    }

    return 0;
}

int Operations::readdir(const char* path, std::vector<std::string>& names) {
    LogRegistry::fuse()->debug("[readdir] Called for path: {}", path);

    int err = 0;
    const auto res = resolve("readdir", path, err);
    if (!res) return err;

    auto listing = resolver_.readdir(*res);
    if (!listing) {
        LogRegistry::fuse()->debug("[readdir] Not a directory: {}", path);
        return -ENOENT;
    }

    names = std::move(*listing);
    return 0;
}

int Operations::readlink(const char* path, std::string& target) {
    LogRegistry::fuse()->debug("[readlink] Called for path: {}", path);

    int err = 0;
    const auto res = resolve("readlink", path, err);
    if (!res) return err;

    if (!res->node.isImage()) {
        LogRegistry::fuse()->warn("[readlink] Not a link: {}", path);
        return -EINVAL;
    }

    target = res->node.image->location().string();
    return 0;
}

int Operations::open(const char* path, const int flags, uint64_t& handle) {
    LogRegistry::fuse()->debug("[open] Called for path: {}, flags: {}", path, flags);

    if ((flags & O_ACCMODE) != O_RDONLY) {
        LogRegistry::fuse()->warn("[open] Refusing write access to {}", path);
        return -EROFS;
    }

    int err = 0;
    const auto res = resolve("open", path, err);
    if (!res) return err;

    if (!res->node.isImage()) {
        LogRegistry::fuse()->warn("[open] Not a file: {}", path);
        return -EINVAL;
    }

    try {
        handle = handles_.insert(res->node.image->open(flags));
    } catch (const std::system_error& e) {
        LogRegistry::fuse()->error("[open] {}: {}", path, e.what());
        return errnoOf(e);
    }

    LogRegistry::fuse()->debug("[open] Opened {} as handle {}", path, handle);
    return 0;
}

int Operations::read(const uint64_t handle, char* buf, const size_t size, const off_t offset) {
    LogRegistry::fuse()->debug("[read] Called for handle: {}, size: {}, offset: {}", handle, size, offset);

    const auto file = handles_.find(handle);
    if (!file) {
        LogRegistry::fuse()->error("[read] Invalid file handle: {}", handle);
        return -EBADF;
    }

    const size_t want = std::min<size_t>(size, INT_MAX);
    size_t done = 0;

    std::scoped_lock lock(file->mutex);
    try {
        if (file->stream->tell() != offset) file->stream->seek(offset);

        // Short reads only at the end of the stream
        while (done < want) {
            const auto n = file->stream->read(buf + done, want - done);
            if (n == 0) break;
            done += n;
        }
    } catch (const std::system_error& e) {
        LogRegistry::fuse()->error("[read] Handle {}: {}", handle, e.what());
        return errnoOf(e);
    }

    return static_cast<int>(done);
}

int Operations::release(const uint64_t handle) {
    LogRegistry::fuse()->debug("[release] Called for handle: {}", handle);

    const auto file = handles_.remove(handle);
    if (!file) {
        LogRegistry::fuse()->error("[release] Unknown or already released handle: {}", handle);
        return -EINVAL;
    }

    std::scoped_lock lock(file->mutex);
    try {
        file->stream->close();
    } catch (const std::system_error& e) {
        LogRegistry::fuse()->error("[release] Failed to close handle {}: {}", handle, e.what());
        return errnoOf(e);
    }
    return 0;
}

int Operations::statfs(const char* path, struct statvfs* st) {
    LogRegistry::fuse()->debug("[statfs] Called for path: {}", path);

    const auto ref = source_.referencePath();
    const std::string target = ref.empty() ? "/" : ref.string();

    if (::statvfs(target.c_str(), st) < 0) {
        const int e = errno;
        LogRegistry::fuse()->error("[statfs] Failed to get filesystem stats for {}: {}", target, std::strerror(e));
        return -e;
    }

    st->f_flag |= ST_RDONLY;
    return 0;
}

void Operations::destroy() {
    if (const auto n = handles_.clear())
        LogRegistry::fuse()->warn("[destroy] Dropping {} handles still open", n);
    LogRegistry::fuse()->info("[destroy] Filesystem torn down");
}
