#pragma once

#define FUSE_USE_VERSION 35

#include <fuse3/fuse.h>

namespace pfs::fuse {

class Operations;

// Routes the libfuse high-level callbacks to ops. Must be bound before mounting.
void bind(Operations* ops);

int getattr(const char* path, struct stat* stbuf, fuse_file_info* fi);

int readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t offset, fuse_file_info* fi,
            fuse_readdir_flags flags);

int readlink(const char* path, char* buf, size_t size);

int open(const char* path, fuse_file_info* fi);

int read(const char* path, char* buf, size_t size, off_t offset, fuse_file_info* fi);

int release(const char* path, fuse_file_info* fi);

int statfs(const char* path, struct statvfs* stbuf);

void* init(fuse_conn_info* conn, fuse_config* cfg);

void destroy(void* private_data);

fuse_operations getOperations();

}
