#pragma once

#include "fs/model/ImageStream.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace pfs::fuse {

// One open stream and the lock that serializes seek+read on it.
struct OpenFile {
    explicit OpenFile(std::unique_ptr<fs::model::ImageStream> s) : stream(std::move(s)) {}

    std::unique_ptr<fs::model::ImageStream> stream;
    std::mutex mutex;
};

// Open streams keyed by handles minted here. The table lock only covers
// insert, lookup and removal; reads hold the per-file lock, so reads on
// different handles never wait for each other.
//
// A handle must not be released while reads on it are outstanding.
class HandleTable {
public:
    uint64_t insert(std::unique_ptr<fs::model::ImageStream> stream);

    [[nodiscard]] std::shared_ptr<OpenFile> find(uint64_t handle) const;

    // nullptr if the handle is unknown or was already released.
    std::shared_ptr<OpenFile> remove(uint64_t handle);

    [[nodiscard]] size_t size() const;

    // Drops every entry; returns how many were open.
    size_t clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<OpenFile>> files_;
    std::atomic<uint64_t> nextHandle_{1};
};

}
