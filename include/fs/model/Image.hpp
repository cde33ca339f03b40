#pragma once

#include "fs/model/ImageStream.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/stat.h>

namespace pfs::fs::model {

// An image or video. Everything but the live attributes and the stream is fixed
// at construction; a reload builds new instances instead of mutating these.
class Image {
public:
    using Clock = std::chrono::system_clock;

    Image(std::string identity,
          std::string title,
          std::string extension,
          Clock::time_point timestamp,
          bool isVideo,
          std::string dateFormat);

    virtual ~Image() = default;

    // The title, or the timestamp rendered with the date format when there is none.
    [[nodiscard]] std::string title() const;

    // Lower case, without the leading dot.
    [[nodiscard]] const std::string& extension() const { return extension_; }
    [[nodiscard]] Clock::time_point timestamp() const { return timestamp_; }
    [[nodiscard]] bool isVideo() const { return isVideo_; }

    // Two instances describe the same media if they were built from the same backend key.
    [[nodiscard]] bool sameAs(const Image& other) const { return identity_ == other.identity_; }

    // Fresh attributes on every call. Throws std::system_error.
    [[nodiscard]] virtual struct stat stat() const = 0;

    // Throws std::system_error.
    [[nodiscard]] virtual std::unique_ptr<ImageStream> open(int flags) const = 0;

    [[nodiscard]] virtual std::filesystem::path location() const = 0;

private:
    std::string identity_;
    std::string title_;
    std::string extension_;
    Clock::time_point timestamp_;
    bool isVideo_;
    std::string dateFormat_;
};

class FileBasedImage final : public Image {
public:
    // isVideo unset means: guess from the extension, then from the file contents.
    FileBasedImage(std::string identity,
                   std::string title,
                   std::filesystem::path location,
                   Clock::time_point timestamp,
                   std::optional<bool> isVideo,
                   std::string dateFormat);

    [[nodiscard]] struct stat stat() const override;
    [[nodiscard]] std::unique_ptr<ImageStream> open(int flags) const override;
    [[nodiscard]] std::filesystem::path location() const override { return location_; }

    static std::string extensionOf(const std::filesystem::path& location);

private:
    std::filesystem::path location_;
};

}
