#pragma once

#include <klib/common.hpp>

namespace squashfs {
    enum class [[nodiscard]] Error : u8 {
        NONE = 0,
        INVALID_SUPERBLOCK, // bad magic, version or geometry, the archive cannot be mounted
        UNSUPPORTED_CODEC, // compression id this kernel has no decompressor for
        CORRUPT_BLOCK, // decompression failed or a record contradicts the archive geometry
        UNEXPECTED_EOF, // a read ran past the end of the archive
        UNSUPPORTED_INODE_TYPE,
        NOT_FOUND,
        NOT_A_DIRECTORY,
        IS_A_DIRECTORY,
        OUT_OF_RANGE, // read past the end of a file
        NOT_A_SYMLINK,
        NO_MEMORY,
    };

    const char* error_string(Error error);

    // negative errno for callers that speak the syscall convention
    isize to_errno(Error error);
}
