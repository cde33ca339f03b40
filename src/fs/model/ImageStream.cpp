#include "fs/model/ImageStream.hpp"

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <system_error>
#include <unistd.h>

using namespace pfs::fs::model;

namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

}

FileStream::FileStream(const std::filesystem::path& path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throwErrno("open " + path.string());
}

FileStream::~FileStream() {
    if (fd_ >= 0) ::close(fd_);
}

void FileStream::seek(const off_t offset) {
    const off_t res = ::lseek(fd_, offset, SEEK_SET);
    if (res < 0) throwErrno("lseek");
    pos_ = res;
}

size_t FileStream::read(char* buf, const size_t size) {
    ssize_t res;
    do {
        res = ::read(fd_, buf, size);
    } while (res < 0 && errno == EINTR);

    if (res < 0) throwErrno("read");
    pos_ += res;
    return static_cast<size_t>(res);
}

void FileStream::close() {
    if (fd_ < 0) return;
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) throwErrno("close");
}
