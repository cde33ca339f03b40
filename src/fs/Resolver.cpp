#include "fs/Resolver.hpp"
#include "source/ImageSource.hpp"
#include "fs/model/Image.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace pfs::fs;
using namespace pfs::fs::model;
using namespace pfs::logging;

Resolver::Resolver(const source::ImageSource& source, std::vector<Filter> filters)
    : source_(source), filters_(std::move(filters)) {
    for (size_t i = 0; i < filters_.size(); ++i)
        for (size_t j = i + 1; j < filters_.size(); ++j)
            if (filters_[i].name() == filters_[j].name())
                throw std::invalid_argument("Duplicate filter name: " + filters_[i].name());
}

std::optional<Resolution> Resolver::locate(const std::string_view path) const {
    const auto [first, rest] = util::splitPath(path);

    if (first.empty() && rest.empty()) {
        auto node = source_.locate("/");
        if (!node) return std::nullopt;
        return Resolution{true, nullptr, std::move(*node)};
    }

    if (filters_.empty()) {
        auto node = source_.locate(path);
        if (!node) return std::nullopt;
        return Resolution{false, nullptr, std::move(*node)};
    }

    const auto* filter = findFilter(first);
    if (!filter) {
        LogRegistry::fs()->debug("[Resolver] '{}' is not a category view", first);
        return std::nullopt;
    }

    // "/Photos/" and "/Photos//" name the view itself
    const bool viewRoot = rest.empty() || util::breakPath(rest).empty();

    auto node = source_.locate(viewRoot ? "/" : rest);
    if (!node) return std::nullopt;

    if (!viewRoot) {
        const bool visible = node->isImage() ? filter->accepts(*node->image) : filter->accepts(*node->tag);
        if (!visible) return std::nullopt;
    }

    return Resolution{false, filter, std::move(*node)};
}

std::optional<std::vector<std::string>> Resolver::readdir(const Resolution& resolution) const {
    std::vector<std::string> names;

    if (resolution.mountRoot && !filters_.empty()) {
        names.reserve(filters_.size());
        for (const auto& f : filters_) names.push_back(f.name());
        return names;
    }

    const auto* tag = resolution.node.tag;
    if (!tag) return std::nullopt;

    names.reserve(tag->size());
    for (const auto& [key, child] : tag->children())
        if (!resolution.filter || resolution.filter->accepts(child)) names.push_back(key);

    return names;
}

const Filter* Resolver::findFilter(const std::string& name) const {
    for (const auto& f : filters_)
        if (f.name() == name) return &f;
    return nullptr;
}
