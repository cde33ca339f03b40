#pragma once

#include "config/Config.hpp"
#include "fs/model/Tag.hpp"

#include <functional>
#include <string>

namespace pfs::fs {

namespace model {
class Image;
}

// A named category view over the tree. An image is in the view when the
// predicate accepts it; a tag is in the view when anything beneath it is.
class Filter {
public:
    using Predicate = std::function<bool(const model::Image&)>;

    Filter(std::string name, Predicate include);

    static Filter fromConfig(const config::FilterConfig& cfg);

    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] bool accepts(const model::Image& image) const;
    [[nodiscard]] bool accepts(const model::Tag& tag) const;
    [[nodiscard]] bool accepts(const model::Tag::Child& child) const;

private:
    std::string name_;
    Predicate include_;
};

}
