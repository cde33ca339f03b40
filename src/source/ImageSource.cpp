#include "source/ImageSource.hpp"
#include "fs/model/Image.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/stat.h>

using namespace pfs::source;
using namespace pfs::fs::model;
using namespace pfs::config;
using namespace pfs::logging;

ImageSource::ImageSource(std::string dateFormat)
    : dateFormat_(dateFormat.empty() ? DEFAULT_DATE_FORMAT : std::move(dateFormat)),
      tree_(std::make_shared<const Tag>()) {}

std::unordered_map<std::string, ImageSource::Factory>& ImageSource::registry() {
    static std::unordered_map<std::string, Factory> sources;
    return sources;
}

std::mutex& ImageSource::registryMutex() {
    static std::mutex mutex;
    return mutex;
}

void ImageSource::registerSource(const std::string& name, Factory factory) {
    std::scoped_lock lock(registryMutex());
    registry()[name] = std::move(factory);
}

ImageSource::Factory ImageSource::get(const std::string& name) {
    std::scoped_lock lock(registryMutex());
    const auto it = registry().find(name);
    if (it == registry().end()) throw ConfigError(name + " is not a valid image source");
    return it->second;
}

std::vector<std::string> ImageSource::names() {
    std::scoped_lock lock(registryMutex());
    std::vector<std::string> out;
    out.reserve(registry().size());
    for (const auto& [name, _] : registry()) out.push_back(name);
    std::ranges::sort(out);
    return out;
}

void ImageSource::refresh() {
    std::scoped_lock refreshLock(refreshMutex_);

    const auto stamp = modificationStamp();
    if (stamp && lastStamp_ && *stamp == *lastStamp_) return;

    const auto start = std::chrono::steady_clock::now();

    // Build the next generation off to the side; readers keep the current one
    auto next = std::make_shared<Tag>();
    loadTags(*next);

    {
        std::unique_lock lock(treeMutex_);
        tree_ = std::move(next);
        ++generation_;
    }
    lastStamp_ = stamp;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LogRegistry::source()->info("[ImageSource] Loaded generation {} in {} ms", generation(), elapsed.count());
}

std::optional<Node> ImageSource::locate(const std::string_view path) const {
    const auto segments = util::breakPath(path);
    const auto tree = root();

    const Tag* current = tree.get();
    const Image* image = nullptr;

    for (const auto& segment : segments) {
        // Images are leaves
        if (image || !current) return std::nullopt;

        const auto* child = current->find(segment);
        if (!child) return std::nullopt;

        if (const auto* tag = std::get_if<std::shared_ptr<Tag>>(child)) current = tag->get();
        else {
            image = std::get<std::shared_ptr<Image>>(*child).get();
            current = nullptr;
        }
    }

    return Node{tree, current, image};
}

std::shared_ptr<const Tag> ImageSource::root() const {
    std::shared_lock lock(treeMutex_);
    return tree_;
}

unsigned int ImageSource::generation() const {
    std::shared_lock lock(treeMutex_);
    return generation_;
}

Tag& ImageSource::makeTags(Tag& root, const std::string_view path) {
    Tag* current = &root;
    for (const auto& segment : util::breakPath(path)) {
        const auto* child = current->find(segment);
        const auto* tag = child ? std::get_if<std::shared_ptr<Tag>>(child) : nullptr;
        if (tag) {
            current = tag->get();
            continue;
        }

        // Missing, or an image sits on the name; add() moves the image aside
        const auto created = std::make_shared<Tag>(segment);
        current->add(created);
        current = created.get();
    }
    return *current;
}

FileBasedImageSource::FileBasedImageSource(std::filesystem::path path, std::string dateFormat)
    : ImageSource(std::move(dateFormat)), path_(std::move(path)) {
    if (path_.empty()) throw ConfigError("No database");
}

std::optional<long long> FileBasedImageSource::modificationStamp() const {
    struct stat st{};
    if (::stat(path_.c_str(), &st) < 0)
        throw SourceError("Failed to stat " + path_.string() + ": " + std::strerror(errno));
    return util::toNanoseconds(st.st_mtim);
}
