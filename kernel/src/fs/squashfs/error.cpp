#include <fs/squashfs/error.hpp>
#include <errno.h>

namespace squashfs {
    const char* error_string(Error error) {
        switch (error) {
        case Error::NONE: return "success";
        case Error::INVALID_SUPERBLOCK: return "invalid superblock";
        case Error::UNSUPPORTED_CODEC: return "unsupported codec";
        case Error::CORRUPT_BLOCK: return "corrupt block";
        case Error::UNEXPECTED_EOF: return "unexpected end of archive";
        case Error::UNSUPPORTED_INODE_TYPE: return "unsupported inode type";
        case Error::NOT_FOUND: return "not found";
        case Error::NOT_A_DIRECTORY: return "not a directory";
        case Error::IS_A_DIRECTORY: return "is a directory";
        case Error::OUT_OF_RANGE: return "out of range";
        case Error::NOT_A_SYMLINK: return "not a symlink";
        case Error::NO_MEMORY: return "out of memory";
        }
        return "unknown error";
    }

    isize to_errno(Error error) {
        switch (error) {
        case Error::NONE: return 0;
        case Error::NOT_FOUND: return -ENOENT;
        case Error::NOT_A_DIRECTORY: return -ENOTDIR;
        case Error::IS_A_DIRECTORY: return -EISDIR;
        case Error::OUT_OF_RANGE: return -EINVAL;
        case Error::NOT_A_SYMLINK: return -EINVAL;
        case Error::NO_MEMORY: return -ENOMEM;
        case Error::UNSUPPORTED_CODEC:
        case Error::UNSUPPORTED_INODE_TYPE: return -EOPNOTSUPP;
        case Error::INVALID_SUPERBLOCK:
        case Error::CORRUPT_BLOCK:
        case Error::UNEXPECTED_EOF: return -EIO;
        }
        return -EIO;
    }
}
