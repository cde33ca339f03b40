#pragma once

#include <filesystem>
#include <sys/types.h>

namespace pfs::fs::model {

// A readable, seekable byte stream for one open media file. Not thread safe;
// the handle table serializes access per stream. Failures throw std::system_error.
class ImageStream {
public:
    virtual ~ImageStream() = default;

    [[nodiscard]] virtual off_t tell() const = 0;
    virtual void seek(off_t offset) = 0;
    virtual size_t read(char* buf, size_t size) = 0;
    virtual void close() = 0;
};

class FileStream final : public ImageStream {
public:
    explicit FileStream(const std::filesystem::path& path);
    ~FileStream() override;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    [[nodiscard]] off_t tell() const override { return pos_; }
    void seek(off_t offset) override;
    size_t read(char* buf, size_t size) override;
    void close() override;

private:
    int fd_{-1};
    off_t pos_{0};
};

}
