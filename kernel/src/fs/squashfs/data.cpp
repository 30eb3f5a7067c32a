#include <fs/squashfs/data.hpp>
#include <klib/algorithm.hpp>
#include <klib/cstring.hpp>

namespace squashfs {
    DataReader::DataReader(BlockSource *source, Codec *codec, MetadataCache *cache, const Superblock *superblock, bool cache_fragments)
        : source(source), codec(codec), cache(cache), superblock(superblock), cache_fragments(cache_fragments) {
        disk_buffer = (u8*)klib::malloc(superblock->block_size);
        block_buffer = (u8*)klib::malloc(superblock->block_size);
        fragment_buffer = (u8*)klib::malloc(superblock->block_size);
    }

    DataReader::~DataReader() {
        klib::free(disk_buffer);
        klib::free(block_buffer);
        klib::free(fragment_buffer);
    }

    Error DataReader::read_fragment_entry(u32 index, format::FragmentEntry *out) {
        if (!superblock->has_fragments() || index >= superblock->fragment_count)
            return Error::CORRUPT_BLOCK;
        return read_lookup_entry(cache, source, superblock->fragment_table, index, sizeof(format::FragmentEntry), out);
    }

    Error DataReader::load_block(u64 disk_offset, u32 word, usize expected, u8 *dst) {
        if (word == 0) {
            // sparse
            memset(dst, 0, expected);
            return Error::NONE;
        }

        u32 length = word & format::data_length_mask;
        bool stored = word & format::data_stored;
        if (length > superblock->block_size)
            return Error::CORRUPT_BLOCK;
        if (klib::add_overflows(disk_offset, length) || disk_offset + length > superblock->bytes_used)
            return Error::UNEXPECTED_EOF;

        if (auto err = source->read(disk_offset, length, disk_buffer); err != Error::NONE)
            return err;

        usize size = 0;
        if (auto err = decompress_block(codec, disk_buffer, length, stored, dst, superblock->block_size, &size); err != Error::NONE)
            return err;
        if (size != expected)
            return Error::CORRUPT_BLOCK;
        return Error::NONE;
    }

    Error DataReader::load_fragment(u32 index) {
        if (cache_fragments && cached_fragment == index)
            return Error::NONE;
        cached_fragment = format::invalid_fragment;

        format::FragmentEntry entry;
        if (auto err = read_fragment_entry(index, &entry); err != Error::NONE)
            return err;

        u32 length = entry.size & format::data_length_mask;
        bool stored = entry.size & format::data_stored;
        if (length == 0 || length > superblock->block_size)
            return Error::CORRUPT_BLOCK;
        if (klib::add_overflows(entry.start_block, length) || entry.start_block + length > superblock->bytes_used)
            return Error::UNEXPECTED_EOF;

        if (auto err = source->read(entry.start_block, length, disk_buffer); err != Error::NONE)
            return err;

        usize size = 0;
        if (auto err = decompress_block(codec, disk_buffer, length, stored, fragment_buffer, superblock->block_size, &size); err != Error::NONE)
            return err;

        fragment_size = size;
        if (cache_fragments)
            cached_fragment = index;
        return Error::NONE;
    }

    Error DataReader::read_range(const Inode &inode, u64 offset, usize length, void *buf) {
        if (!inode.is_regular())
            return Error::OUT_OF_RANGE;
        if (klib::add_overflows(offset, length) || offset + length > inode.size)
            return Error::OUT_OF_RANGE;
        if (length == 0)
            return Error::NONE;

        u8 *dst = (u8*)buf;
        u64 block_size = superblock->block_size;
        const BlockList &blocks = inode.blocks;
        u64 block_count = blocks.sizes.size();
        u64 blocks_end = block_count * block_size; // file bytes covered by the block list

        // position of the first block touched, blocks are laid out back to back
        u64 index = offset / block_size;
        u64 disk_offset = blocks.start;
        for (u64 i = 0; i < klib::min(index, block_count); i++)
            disk_offset += blocks.sizes[i] & format::data_length_mask;

        while (length > 0) {
            usize copied;

            if (offset < blocks_end) {
                index = offset / block_size;
                u64 in_block = offset % block_size;
                usize expected = klib::min(block_size, inode.size - index * block_size);
                u32 word = blocks.sizes[index];

                if (auto err = load_block(disk_offset, word, expected, block_buffer); err != Error::NONE)
                    return err;

                copied = klib::min((u64)length, expected - in_block);
                memcpy(dst, block_buffer + in_block, copied);
                disk_offset += word & format::data_length_mask;
            } else {
                if (!blocks.has_fragment())
                    return Error::CORRUPT_BLOCK;

                u64 tail = inode.size - blocks_end;
                u64 in_tail = offset - blocks_end;
                if (auto err = load_fragment(blocks.fragment_index); err != Error::NONE)
                    return err;
                if (blocks.fragment_offset > fragment_size || fragment_size - blocks.fragment_offset < tail) {
                    cached_fragment = format::invalid_fragment;
                    return Error::CORRUPT_BLOCK;
                }

                copied = length;
                memcpy(dst, fragment_buffer + blocks.fragment_offset + in_tail, copied);
            }

            dst += copied;
            offset += copied;
            length -= copied;
        }
        return Error::NONE;
    }
}
