#include "fs/model/Tag.hpp"
#include "fs/model/Image.hpp"
#include "util/uniqueKey.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace pfs::fs::model;
using namespace pfs::logging;

Tag::Tag(std::string name) : name_(std::move(name)) {}

std::string Tag::add(const std::shared_ptr<Image>& image) {
    if (!image) throw std::invalid_argument("Cannot add a null image to tag '" + name_ + "'");

    const auto ext = image->extension().empty() ? std::string{} : "." + image->extension();
    const auto key = util::makeUniqueKey(children_, image->title(), ext);

    // makeUniqueKey only returns free keys, so a tag can never be overwritten here
    if (const auto it = children_.find(key); it != children_.end())
        throw std::logic_error("Refusing to overwrite '" + key + "' in tag '" + name_ + "' with an image");

    children_.emplace(key, image);
    markContents(!image->isVideo(), image->isVideo());
    return key;
}

void Tag::add(const std::shared_ptr<Tag>& tag) {
    if (!tag) throw std::invalid_argument("Cannot add a null tag to tag '" + name_ + "'");
    for (const Tag* t = this; t; t = t->parent_)
        if (t == tag.get()) throw std::invalid_argument("Cannot add tag '" + tag->name_ + "' beneath itself");

    std::shared_ptr<Image> displaced;
    if (const auto it = children_.find(tag->name_); it != children_.end()) {
        if (const auto* img = std::get_if<std::shared_ptr<Image>>(&it->second)) displaced = *img;
        else LogRegistry::fs()->debug("[Tag] Replacing tag '{}' in '{}'", tag->name_, path());
        children_.erase(it);
    }

    tag->parent_ = this;
    children_.emplace(tag->name_, tag);
    markContents(tag->hasImage_, tag->hasVideo_);

    // The image loses its slot to the tag, not its place in the tree
    if (displaced) {
        const auto key = add(displaced);
        LogRegistry::fs()->debug("[Tag] Tag '{}' displaced an image in '{}', moved to '{}'", tag->name_, path(), key);
    }
}

size_t Tag::remove(const Image& image) {
    return std::erase_if(children_, [&](const auto& entry) {
        const auto* img = std::get_if<std::shared_ptr<Image>>(&entry.second);
        return img && (*img)->sameAs(image);
    });
}

const Tag::Child* Tag::find(const std::string& key) const {
    const auto it = children_.find(key);
    return it == children_.end() ? nullptr : &it->second;
}

std::string Tag::path() const {
    if (!parent_) return name_.empty() ? "/" : "/" + name_;
    const auto parentPath = parent_->path();
    return (parentPath == "/" ? parentPath : parentPath + "/") + name_;
}

void Tag::markContents(const bool image, const bool video) {
    for (Tag* t = this; t; t = t->parent_) {
        if ((!image || t->hasImage_) && (!video || t->hasVideo_)) break;
        t->hasImage_ = t->hasImage_ || image;
        t->hasVideo_ = t->hasVideo_ || video;
    }
}
