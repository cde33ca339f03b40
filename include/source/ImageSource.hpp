#pragma once

#include "config/Config.hpp"
#include "fs/model/Node.hpp"
#include "fs/model/Tag.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pfs::source {

// A backend resource could not be read: stat of the catalogue failed, the
// database is corrupt, a query failed.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A source of images and tags. The source owns an unnamed root tag whose
// children are the root tags; it is the root directory of the mount.
//
// Every reload builds a complete new tree and publishes it in one step, so a
// reader sees either the previous generation or the new one, never a tree
// that is still being filled.
class ImageSource {
public:
    using Factory = std::function<std::unique_ptr<ImageSource>(const config::SourceConfig&)>;

    explicit ImageSource(std::string dateFormat = config::DEFAULT_DATE_FORMAT);
    virtual ~ImageSource() = default;

    ImageSource(const ImageSource&) = delete;
    ImageSource& operator=(const ImageSource&) = delete;

    static void registerSource(const std::string& name, Factory factory);

    // Throws config::ConfigError for unknown names.
    static Factory get(const std::string& name);

    static std::vector<std::string> names();

    // Reloads the tree if the backend changed since the last reload. Throws
    // SourceError; the published tree is left as it was in that case.
    void refresh();

    // Walks an absolute path through the current tree. Does not refresh.
    // Throws std::invalid_argument for relative paths.
    [[nodiscard]] std::optional<fs::model::Node> locate(std::string_view path) const;

    [[nodiscard]] std::shared_ptr<const fs::model::Tag> root() const;

    // Number of completed reloads.
    [[nodiscard]] unsigned int generation() const;

    [[nodiscard]] const std::string& dateFormat() const { return dateFormat_; }

    // Directory whose attributes stand in for every virtual directory; empty if the source has none.
    [[nodiscard]] virtual std::filesystem::path referencePath() const { return {}; }

protected:
    // Backend staleness marker; any change triggers a reload. nullopt always reloads.
    [[nodiscard]] virtual std::optional<long long> modificationStamp() const = 0;

    // Fills a fresh root with tags and images. Throws SourceError.
    virtual void loadTags(fs::model::Tag& root) = 0;

    // Makes sure every tag along "/A/B/C" exists beneath root and returns C.
    static fs::model::Tag& makeTags(fs::model::Tag& root, std::string_view path);

private:
    std::string dateFormat_;

    mutable std::shared_mutex treeMutex_;
    std::shared_ptr<const fs::model::Tag> tree_;
    unsigned int generation_{0};

    std::mutex refreshMutex_;
    std::optional<long long> lastStamp_;

    static std::unordered_map<std::string, Factory>& registry();
    static std::mutex& registryMutex();
};

// A source whose backend is a single file; its mtime is the staleness marker.
class FileBasedImageSource : public ImageSource {
public:
    // Throws config::ConfigError when path is empty.
    FileBasedImageSource(std::filesystem::path path, std::string dateFormat);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::filesystem::path referencePath() const override { return path_.parent_path(); }

protected:
    [[nodiscard]] std::optional<long long> modificationStamp() const override;

private:
    std::filesystem::path path_;
};

// Registers every source compiled into this binary.
void registerBuiltinSources();

}
