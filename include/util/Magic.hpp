#pragma once

#include <filesystem>
#include <magic.h>
#include <mutex>
#include <optional>
#include <string>

namespace pfs::util {

class Magic {
public:
    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    std::string mime_type(const std::string& path) const;

    static std::string get_mime_type(const std::string& path);

    // MIME type implied by a lower-case extension without its dot, if known.
    static std::optional<std::string> mime_type_for_extension(const std::string& extension);

    // Extension lookup first; content sniffing of location when the extension is unknown.
    static bool is_video(const std::string& extension, const std::filesystem::path& location);

private:
    magic_t cookie;
    mutable std::mutex mutex_;
};

}
