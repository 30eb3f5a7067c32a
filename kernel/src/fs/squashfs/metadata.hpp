#pragma once

#include <klib/list.hpp>
#include <fs/squashfs/format.hpp>
#include <fs/squashfs/block_source.hpp>
#include <fs/squashfs/codec.hpp>
#include <panic.hpp>

namespace squashfs {
    // one decompressed metadata block, immutable once it is in the cache
    struct MetadataBlock {
        u64 offset; // absolute offset of the 2 byte header
        u16 disk_length; // payload length on disk, without the header
        u16 size; // decompressed bytes in data
        u8 data[format::metadata_size];

        u64 next_offset() const { return offset + sizeof(u16) + disk_length; }
    };

    struct MetadataCacheStats {
        u64 hits;
        u64 misses;
        u64 evictions;
    };

    // fixed capacity cache of decompressed metadata blocks with least recently used eviction.
    // all of its memory is allocated up front, so the footprint never grows after mount.
    class MetadataCache {
        struct Slot {
            klib::ListHead lru_link; // in lru or free_slots
            klib::ListHead hash_link; // in a bucket while resident
            MetadataBlock block;
        };

        BlockSource *source;
        Codec *codec;
        u64 limit; // metadata never extends past this offset

        Slot *slots = nullptr;
        usize capacity;
        usize used = 0;
        klib::ListHead lru; // most recently used first
        klib::ListHead free_slots;
        klib::ListHead *buckets = nullptr; // resident slots by block offset
        usize bucket_count;
        u8 *disk_buffer = nullptr;
        MetadataCacheStats stats = {};

        Error load(u64 offset, MetadataBlock *block);
        klib::ListHead* bucket(u64 offset) const { return &buckets[klib::hash(offset) % bucket_count]; }
        Slot* find(u64 offset) const;

    public:
        MetadataCache(BlockSource *source, Codec *codec, u64 limit, usize capacity);
        ~MetadataCache();

        MetadataCache(const MetadataCache &) = delete;
        MetadataCache& operator=(const MetadataCache &) = delete;

        // false if the slots could not be allocated
        bool valid() const { return slots != nullptr && buckets != nullptr && disk_buffer != nullptr; }

        // returns the block whose header is at offset, decompressing it on a miss
        Error get(u64 offset, const MetadataBlock **out);

        bool contains(u64 offset) const { return find(offset) != nullptr; }
        usize resident() const { return used; }
        usize max_resident() const { return capacity; }
        const MetadataCacheStats& statistics() const { return stats; }
    };

    // sequential reader over a chain of metadata blocks, records may straddle block boundaries.
    // it only ever moves forward, seek by making a new one.
    class MetadataReader {
        MetadataCache *cache;
        u64 block_offset; // absolute
        usize offset; // inside the decompressed block

    public:
        MetadataReader(MetadataCache *cache, u64 table_start, u64 block, u16 offset)
            : cache(cache), block_offset(table_start + block), offset(offset) {}

        Error read(void *buf, usize count);
        Error skip(usize count);

        template<typename T>
        Error read(T *out) { return read(out, sizeof(T)); }

        u64 position_block() const { return block_offset; }
        usize position_offset() const { return offset; }
    };

    // two level tables (fragments, ids, export): an array of u64 block offsets at table_start,
    // pointing to metadata blocks that hold the fixed size entries back to back
    Error read_lookup_entry(MetadataCache *cache, BlockSource *source, u64 table_start, u64 index, usize entry_size, void *out);
}
