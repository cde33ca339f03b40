#include "fs/Filter.hpp"
#include "fs/model/Image.hpp"

#include <algorithm>
#include <stdexcept>

using namespace pfs::fs;
using namespace pfs::fs::model;
using namespace pfs::config;

Filter::Filter(std::string name, Predicate include)
    : name_(std::move(name)), include_(std::move(include)) {
    if (!include_) throw std::invalid_argument("Filter '" + name_ + "' has no predicate");
}

Filter Filter::fromConfig(const FilterConfig& cfg) {
    switch (cfg.include) {
        case MediaKind::Photos: return {cfg.name, [](const Image& i) { return !i.isVideo(); }};
        case MediaKind::Videos: return {cfg.name, [](const Image& i) { return i.isVideo(); }};
        case MediaKind::All: return {cfg.name, [](const Image&) { return true; }};
    }
    throw ConfigError("Unknown filter kind for '" + cfg.name + "'");
}

bool Filter::accepts(const Image& image) const { return include_(image); }

bool Filter::accepts(const Tag& tag) const {
    return std::ranges::any_of(tag.children(), [this](const auto& entry) { return accepts(entry.second); });
}

bool Filter::accepts(const Tag::Child& child) const {
    return std::visit([this](const auto& item) { return item && accepts(*item); }, child);
}
