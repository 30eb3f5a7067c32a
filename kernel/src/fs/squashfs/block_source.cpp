#include <fs/squashfs/block_source.hpp>
#include <klib/algorithm.hpp>
#include <klib/cstring.hpp>

namespace squashfs {
    Error MemoryBlockSource::read(u64 offset, usize count, void *buf) {
        if (klib::add_overflows(offset, count) || offset + count > length)
            return Error::UNEXPECTED_EOF;
        if (count)
            memcpy(buf, base + offset, count);
        return Error::NONE;
    }
}
