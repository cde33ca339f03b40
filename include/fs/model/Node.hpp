#pragma once

#include "fs/model/Tag.hpp"

#include <memory>

namespace pfs::fs::model {

class Image;

// The result of locating a path in one generation of the tag tree. Holding
// the generation keeps the item alive across a concurrent reload.
struct Node {
    std::shared_ptr<const Tag> tree;
    const Tag* tag{nullptr};
    const Image* image{nullptr};

    [[nodiscard]] bool isRoot() const { return tag && tag == tree.get(); }
    [[nodiscard]] bool isDirectory() const { return tag != nullptr; }
    [[nodiscard]] bool isImage() const { return image != nullptr; }
};

}
