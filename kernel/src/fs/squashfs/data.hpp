#pragma once

#include <fs/squashfs/inode.hpp>

namespace squashfs {
    // reads file contents: full data blocks from the block list, the tail from a fragment block
    class DataReader {
        BlockSource *source;
        Codec *codec;
        MetadataCache *cache;
        const Superblock *superblock;
        bool cache_fragments;

        // all of them block_size bytes
        u8 *disk_buffer = nullptr;
        u8 *block_buffer = nullptr;
        u8 *fragment_buffer = nullptr;

        u32 cached_fragment = format::invalid_fragment;
        usize fragment_size = 0;

        Error load_block(u64 disk_offset, u32 word, usize expected, u8 *dst);
        Error load_fragment(u32 index);

    public:
        DataReader(BlockSource *source, Codec *codec, MetadataCache *cache, const Superblock *superblock, bool cache_fragments);
        ~DataReader();

        DataReader(const DataReader &) = delete;
        DataReader& operator=(const DataReader &) = delete;

        bool valid() const { return disk_buffer && block_buffer && fragment_buffer; }

        Error read_fragment_entry(u32 index, format::FragmentEntry *out);

        // fills buf with exactly length bytes of the file starting at offset
        Error read_range(const Inode &inode, u64 offset, usize length, void *buf);

        bool fragment_cached(u32 index) const { return cache_fragments && cached_fragment == index; }
    };
}
