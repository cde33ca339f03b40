#pragma once

#include "source/ImageSource.hpp"

#include <filesystem>
#include <optional>

namespace pfs::source {

// Loads images and videos from a Shotwell photo.db.
class ShotwellSource final : public FileBasedImageSource {
public:
    static constexpr const auto* NAME = "shotwell";

    // Falls back to defaultLocation() when the configured database is empty.
    explicit ShotwellSource(const config::SourceConfig& cfg);

    // First readable shotwell/data/photo.db under the XDG data directories.
    static std::optional<std::filesystem::path> defaultLocation();

protected:
    void loadTags(fs::model::Tag& root) override;
};

}
