#pragma once

#include "fs/Resolver.hpp"
#include "fuse/HandleTable.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <vector>

namespace pfs::source {
class ImageSource;
}

namespace pfs::fuse {

// The filesystem callbacks, independent of the kernel transport. Every call
// is resolved from its path against the current tree; the open handle table
// is the only state kept between calls.
//
// Return values follow libfuse: 0 or a byte count on success, -errno on failure.
class Operations {
public:
    // dirStat stands in for every virtual directory; useSymlinks presents media as links.
    Operations(source::ImageSource& source, fs::Resolver resolver, const struct stat& dirStat, bool useSymlinks = false);

    // lstat of dir, or a plain 0555 directory owned by the caller if that fails.
    static struct stat referenceStat(const std::filesystem::path& dir);

    int getattr(const char* path, struct stat* st);
    int readdir(const char* path, std::vector<std::string>& names);
    int readlink(const char* path, std::string& target);
    int open(const char* path, int flags, uint64_t& handle);
    int read(uint64_t handle, char* buf, size_t size, off_t offset);
    int release(uint64_t handle);
    int statfs(const char* path, struct statvfs* st);
    void destroy();

    [[nodiscard]] size_t openHandles() const { return handles_.size(); }

private:
    source::ImageSource& source_;
    fs::Resolver resolver_;
    struct stat dirStat_;
    bool useSymlinks_;
    HandleTable handles_;

    // Refreshes the source and resolves path; on failure err holds -errno.
    std::optional<fs::Resolution> resolve(const char* op, const char* path, int& err);
};

}
