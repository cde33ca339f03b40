#pragma once

#include "source/ImageSource.hpp"
#include "fs/model/Image.hpp"
#include "fs/model/ImageStream.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace pfs::test {

// A stream over a string, failing like a closed descriptor once closed.
class MemoryStream final : public fs::model::ImageStream {
public:
    explicit MemoryStream(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] off_t tell() const override { return pos_; }

    void seek(const off_t offset) override {
        if (closed_) throw std::system_error(EBADF, std::generic_category(), "seek");
        if (offset < 0) throw std::system_error(EINVAL, std::generic_category(), "seek");
        pos_ = offset;
    }

    size_t read(char* buf, const size_t size) override {
        if (closed_) throw std::system_error(EBADF, std::generic_category(), "read");
        if (static_cast<size_t>(pos_) >= data_.size()) return 0;
        const auto n = std::min(size, data_.size() - static_cast<size_t>(pos_));
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += static_cast<off_t>(n);
        return n;
    }

    void close() override {
        if (closed_) throw std::system_error(EBADF, std::generic_category(), "close");
        closed_ = true;
    }

private:
    std::string data_;
    off_t pos_{0};
    bool closed_{false};
};

// Media whose bytes live in memory.
class MemoryImage final : public fs::model::Image {
public:
    MemoryImage(std::string identity, std::string title, std::string extension, std::string data,
                const bool isVideo = false, const mode_t mode = 0644)
        : Image(identity, std::move(title), std::move(extension), Clock::time_point{}, isVideo, config::DEFAULT_DATE_FORMAT),
          identity_(std::move(identity)), data_(std::move(data)), mode_(mode) {}

    [[nodiscard]] struct stat stat() const override {
        struct stat st{};
        st.st_mode = S_IFREG | mode_;
        st.st_nlink = 1;
        st.st_size = static_cast<off_t>(data_.size());
        return st;
    }

    [[nodiscard]] std::unique_ptr<fs::model::ImageStream> open(int) const override {
        return std::make_unique<MemoryStream>(data_);
    }

    [[nodiscard]] std::filesystem::path location() const override { return "/memory/" + identity_; }

private:
    std::string identity_;
    std::string data_;
    mode_t mode_;
};

// A source fed by a callback, with a staleness stamp under test control.
class TestSource final : public source::ImageSource {
public:
    using Loader = std::function<void(fs::model::Tag&)>;

    explicit TestSource(Loader loader = {}) : loader_(std::move(loader)) {}

    long long stamp{0};
    bool failing{false};
    std::atomic<int> loads{0};

    using ImageSource::makeTags;

protected:
    [[nodiscard]] std::optional<long long> modificationStamp() const override {
        if (failing) throw source::SourceError("backend unavailable");
        return stamp;
    }

    void loadTags(fs::model::Tag& root) override {
        ++loads;
        if (loader_) loader_(root);
    }

private:
    Loader loader_;
};

inline std::shared_ptr<MemoryImage> photo(const std::string& id, const std::string& title, const std::string& data = "photo") {
    return std::make_shared<MemoryImage>(id, title, "jpg", data, false);
}

inline std::shared_ptr<MemoryImage> video(const std::string& id, const std::string& title, const std::string& data = "video") {
    return std::make_shared<MemoryImage>(id, title, "mp4", data, true);
}

}
