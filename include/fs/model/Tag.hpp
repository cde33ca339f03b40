#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>

namespace pfs::fs::model {

class Image;

// A tag applied to images and videos, and a directory in the mounted tree.
//
// Tags are hierarchical: a tag has zero or one parent and any number of
// subtags. An image carrying several tags is present once per tag, as
// separate Image instances that compare sameAs() each other.
//
// Children are keyed by file name. Keys are unique; images never displace
// anything, a tag displaces a tag of the same name and pushes an image of the
// same name aside to a fresh " (n)" name.
class Tag {
public:
    using Child = std::variant<std::shared_ptr<Image>, std::shared_ptr<Tag>>;
    using Children = std::map<std::string, Child>;

    // An empty name makes a root.
    explicit Tag(std::string name = {});

    Tag(const Tag&) = delete;
    Tag& operator=(const Tag&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] Tag* parent() const { return parent_; }

    // Whether this subtree contains at least one photo / at least one video.
    [[nodiscard]] bool hasImage() const { return hasImage_; }
    [[nodiscard]] bool hasVideo() const { return hasVideo_; }

    // Returns the key the image was stored under. Throws std::invalid_argument for null.
    std::string add(const std::shared_ptr<Image>& image);

    // Throws std::invalid_argument for null, for this tag itself, or for an ancestor.
    void add(const std::shared_ptr<Tag>& tag);

    // Drops every direct child image that is sameAs(image). Returns the number removed.
    size_t remove(const Image& image);

    [[nodiscard]] const Children& children() const { return children_; }
    [[nodiscard]] const Child* find(const std::string& key) const;
    [[nodiscard]] size_t size() const { return children_.size(); }
    [[nodiscard]] bool empty() const { return children_.empty(); }

    // "/A/B/C" for a tag C under B under A; "/" for a root.
    [[nodiscard]] std::string path() const;

private:
    std::string name_;
    Tag* parent_{nullptr};
    Children children_;
    bool hasImage_{false};
    bool hasVideo_{false};

    void markContents(bool image, bool video);
};

}
