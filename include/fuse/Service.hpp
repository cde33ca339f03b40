#pragma once

#include "fuse/Bridge.hpp"

namespace pfs::fuse {

class Operations;

// Mounts the filesystem and serves requests until unmounted or signalled.
class Service final {
public:
    explicit Service(Operations& ops);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Takes the remaining libfuse command line (mountpoint, -f, -s, -o ...).
    // Returns the process exit status.
    int run(fuse_args& args);

private:
    Operations& ops_;
};

}
