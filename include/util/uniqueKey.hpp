#pragma once

#include <string>

namespace pfs::util {

// Returns "base + ext" if that key is free in mapping, otherwise the first free
// "base (n) + ext" for n = 2, 3, ... The extension must carry its own dot.
template <typename Map>
std::string makeUniqueKey(const Map& mapping, const std::string& base, const std::string& ext = {}) {
    std::string key = base + ext;
    for (unsigned int i = 2; mapping.contains(key); ++i)
        key = base + " (" + std::to_string(i) + ")" + ext;
    return key;
}

}
