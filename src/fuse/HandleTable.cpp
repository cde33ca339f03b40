#include "fuse/HandleTable.hpp"

using namespace pfs::fuse;

uint64_t HandleTable::insert(std::unique_ptr<fs::model::ImageStream> stream) {
    auto file = std::make_shared<OpenFile>(std::move(stream));
    const auto handle = nextHandle_.fetch_add(1, std::memory_order_relaxed);

    std::scoped_lock lock(mutex_);
    files_.emplace(handle, std::move(file));
    return handle;
}

std::shared_ptr<OpenFile> HandleTable::find(const uint64_t handle) const {
    std::scoped_lock lock(mutex_);
    const auto it = files_.find(handle);
    return it == files_.end() ? nullptr : it->second;
}

std::shared_ptr<OpenFile> HandleTable::remove(const uint64_t handle) {
    std::scoped_lock lock(mutex_);
    const auto it = files_.find(handle);
    if (it == files_.end()) return nullptr;
    auto file = std::move(it->second);
    files_.erase(it);
    return file;
}

size_t HandleTable::size() const {
    std::scoped_lock lock(mutex_);
    return files_.size();
}

size_t HandleTable::clear() {
    std::unordered_map<uint64_t, std::shared_ptr<OpenFile>> dropped;
    {
        std::scoped_lock lock(mutex_);
        dropped.swap(files_);
    }
    return dropped.size();
}
