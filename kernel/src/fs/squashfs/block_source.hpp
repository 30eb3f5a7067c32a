#pragma once

#include <klib/common.hpp>
#include <fs/squashfs/error.hpp>

namespace squashfs {
    // the raw bytes an archive lives in
    struct BlockSource {
        virtual ~BlockSource() {}

        virtual u64 size() const = 0;

        // copies exactly count bytes starting at offset, or fails with UNEXPECTED_EOF
        virtual Error read(u64 offset, usize count, void *buf) = 0;
    };

    // an archive that is already in memory, like a boot loader module
    struct MemoryBlockSource final : public BlockSource {
        MemoryBlockSource(const void *base, usize size) : base((const u8*)base), length(size) {}

        u64 size() const override { return length; }
        Error read(u64 offset, usize count, void *buf) override;

    private:
        const u8 *base;
        usize length;
    };
}
