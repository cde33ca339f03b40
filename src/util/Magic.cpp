#include "util/Magic.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <unordered_map>

using namespace pfs::util;
using namespace pfs::logging;

namespace {

const std::unordered_map<std::string, std::string>& extensionTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"jpe", "image/jpeg"},
        {"png", "image/png"}, {"gif", "image/gif"}, {"bmp", "image/bmp"},
        {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"webp", "image/webp"},
        {"heic", "image/heic"}, {"heif", "image/heif"},
        {"cr2", "image/x-canon-cr2"}, {"nef", "image/x-nikon-nef"}, {"dng", "image/x-adobe-dng"},
        {"arw", "image/x-sony-arw"}, {"orf", "image/x-olympus-orf"}, {"raf", "image/x-fuji-raf"},
        {"mp4", "video/mp4"}, {"m4v", "video/x-m4v"}, {"mov", "video/quicktime"},
        {"qt", "video/quicktime"}, {"avi", "video/x-msvideo"}, {"mkv", "video/x-matroska"},
        {"webm", "video/webm"}, {"mpg", "video/mpeg"}, {"mpeg", "video/mpeg"},
        {"mts", "video/mp2t"}, {"m2ts", "video/mp2t"}, {"3gp", "video/3gpp"},
        {"ogv", "video/ogg"}, {"wmv", "video/x-ms-wmv"}, {"flv", "video/x-flv"},
    };
    return table;
}

}

Magic::Magic() {
    cookie = magic_open(MAGIC_MIME_TYPE);
    if (!cookie) throw std::runtime_error("Failed to create magic cookie");

    // Let libmagic find its own database
    if (magic_load(cookie, nullptr) != 0) {
        std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        magic_close(cookie);
        throw std::runtime_error("Failed to load magic database: " + err);
    }
}

Magic::~Magic() {
    if (cookie) magic_close(cookie);
}

std::string Magic::mime_type(const std::string& path) const {
    if (path.empty()) throw std::invalid_argument("Cannot detect MIME type of empty path");

    // magic_t is not thread safe
    std::scoped_lock lock(mutex_);
    const char* result = magic_file(cookie, path.c_str());
    if (!result) {
        std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        throw std::runtime_error("magic_file failed: " + err);
    }
    return {result};
}

std::string Magic::get_mime_type(const std::string& path) {
    static Magic instance;
    return instance.mime_type(path);
}

std::optional<std::string> Magic::mime_type_for_extension(const std::string& extension) {
    const auto& table = extensionTable();
    if (const auto it = table.find(extension); it != table.end()) return it->second;
    return std::nullopt;
}

bool Magic::is_video(const std::string& extension, const std::filesystem::path& location) {
    if (const auto mime = mime_type_for_extension(extension)) return mime->starts_with("video/");

    try {
        return get_mime_type(location.string()).starts_with("video/");
    } catch (const std::exception& e) {
        LogRegistry::fs()->debug("[Magic] Could not sniff {}: {}", location.string(), e.what());
        return false;
    }
}
