#pragma once

#include "fs/Filter.hpp"
#include "fs/model/Node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::source {
class ImageSource;
}

namespace pfs::fs {

struct Resolution {
    // The mount point itself
    bool mountRoot{false};

    // The category view the path lies in, if filters are configured
    const Filter* filter{nullptr};

    model::Node node;
};

// Maps mount paths onto the source's tree. Without filters the root tags sit
// directly beneath the mount point; with filters every filter is a top level
// directory showing the whole tree through its predicate.
class Resolver {
public:
    Resolver(const source::ImageSource& source, std::vector<Filter> filters);

    // nullopt when the path does not exist in the tree or in the view it names.
    // Throws std::invalid_argument for relative paths.
    [[nodiscard]] std::optional<Resolution> locate(std::string_view path) const;

    // Names beneath a resolved directory; nullopt if it is not one.
    [[nodiscard]] std::optional<std::vector<std::string>> readdir(const Resolution& resolution) const;

private:
    const source::ImageSource& source_;
    std::vector<Filter> filters_;

    [[nodiscard]] const Filter* findFilter(const std::string& name) const;
};

}
