#include "fs/model/Image.hpp"
#include "util/Magic.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>

using namespace pfs::fs::model;

Image::Image(std::string identity,
             std::string title,
             std::string extension,
             const Clock::time_point timestamp,
             const bool isVideo,
             std::string dateFormat)
    : identity_(std::move(identity)),
      title_(std::move(title)),
      extension_(std::move(extension)),
      timestamp_(timestamp),
      isVideo_(isVideo),
      dateFormat_(std::move(dateFormat)) {
    std::ranges::transform(extension_, extension_.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

std::string Image::title() const {
    if (!title_.empty()) return title_;
    return util::formatTimestamp(timestamp_, dateFormat_);
}

FileBasedImage::FileBasedImage(std::string identity,
                               std::string title,
                               std::filesystem::path location,
                               const Clock::time_point timestamp,
                               const std::optional<bool> isVideo,
                               std::string dateFormat)
    : Image(std::move(identity),
            std::move(title),
            extensionOf(location),
            timestamp,
            isVideo ? *isVideo : util::Magic::is_video(extensionOf(location), location),
            std::move(dateFormat)),
      location_(std::move(location)) {}

std::string FileBasedImage::extensionOf(const std::filesystem::path& location) {
    auto ext = location.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

struct stat FileBasedImage::stat() const {
    struct stat st{};
    if (::lstat(location_.c_str(), &st) < 0)
        throw std::system_error(errno, std::generic_category(), "lstat " + location_.string());
    return st;
}

std::unique_ptr<ImageStream> FileBasedImage::open(const int flags) const {
    (void)flags;
    return std::make_unique<FileStream>(location_);
}
