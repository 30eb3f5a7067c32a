#include <fs/squashfs/metadata.hpp>
#include <klib/algorithm.hpp>
#include <klib/cstdlib.hpp>
#include <klib/cstring.hpp>

namespace squashfs {
    MetadataCache::MetadataCache(BlockSource *source, Codec *codec, u64 limit, usize capacity)
        : source(source), codec(codec), limit(limit), capacity(klib::max(capacity, (usize)1)) {
        lru.init();
        free_slots.init();
        bucket_count = this->capacity * 2 + 1;

        // one slot more than the capacity, a miss decompresses into the spare before anything is evicted.
        // the index is intrusive, so nothing is allocated after this point
        slots = (Slot*)klib::malloc((this->capacity + 1) * sizeof(Slot));
        buckets = (klib::ListHead*)klib::malloc(bucket_count * sizeof(klib::ListHead));
        disk_buffer = (u8*)klib::malloc(format::metadata_size);
        if (slots == nullptr || buckets == nullptr)
            return;
        for (usize i = 0; i < bucket_count; i++)
            buckets[i].init();
        for (usize i = 0; i < this->capacity + 1; i++) {
            new (&slots[i]) Slot();
            free_slots.add_before(&slots[i].lru_link);
        }
    }

    MetadataCache::~MetadataCache() {
        klib::free(slots);
        klib::free(buckets);
        klib::free(disk_buffer);
    }

    MetadataCache::Slot* MetadataCache::find(u64 offset) const {
        klib::ListHead *list = bucket(offset);
        Slot *slot;
        LIST_FOR_EACH(slot, list, hash_link)
            if (slot->block.offset == offset)
                return slot;
        return nullptr;
    }

    Error MetadataCache::load(u64 offset, MetadataBlock *block) {
        if (offset >= limit || limit - offset < sizeof(u16))
            return Error::UNEXPECTED_EOF;

        u16 header;
        if (auto err = source->read(offset, sizeof(header), &header); err != Error::NONE)
            return err;

        u16 disk_length = header & format::metadata_length_mask;
        bool stored = header & format::metadata_stored;
        if (disk_length == 0 || disk_length > format::metadata_size)
            return Error::CORRUPT_BLOCK;
        if (limit - offset - sizeof(u16) < disk_length)
            return Error::UNEXPECTED_EOF;

        if (auto err = source->read(offset + sizeof(u16), disk_length, disk_buffer); err != Error::NONE)
            return err;

        usize size = 0;
        if (auto err = decompress_block(codec, disk_buffer, disk_length, stored, block->data, format::metadata_size, &size); err != Error::NONE)
            return err;
        if (size == 0)
            return Error::CORRUPT_BLOCK;

        block->offset = offset;
        block->disk_length = disk_length;
        block->size = size;
        return Error::NONE;
    }

    Error MetadataCache::get(u64 offset, const MetadataBlock **out) {
        if (Slot *slot = find(offset)) {
            slot->lru_link.remove();
            lru.add(&slot->lru_link);
            stats.hits++;
            *out = &slot->block;
            return Error::NONE;
        }

        stats.misses++;

        ASSERT(!free_slots.is_empty());
        Slot *slot = LIST_HEAD(&free_slots, Slot, lru_link);
        if (auto err = load(offset, &slot->block); err != Error::NONE)
            return err; // the spare stays free, nothing resident was touched

        if (used == capacity) {
            Slot *victim = LIST_TAIL(&lru, Slot, lru_link);
            victim->hash_link.remove();
            victim->lru_link.remove();
            free_slots.add_before(&victim->lru_link);
            used--;
            stats.evictions++;
        }

        slot->lru_link.remove();
        lru.add(&slot->lru_link);
        bucket(offset)->add(&slot->hash_link);
        used++;

        *out = &slot->block;
        return Error::NONE;
    }

    static Error read_or_skip(MetadataCache *cache, u64 *block_offset, usize *offset, u8 *dst, usize count) {
        while (count > 0) {
            const MetadataBlock *block;
            if (auto err = cache->get(*block_offset, &block); err != Error::NONE)
                return err;

            if (*offset > block->size)
                return Error::CORRUPT_BLOCK;
            if (*offset == block->size) {
                *block_offset = block->next_offset();
                *offset = 0;
                continue;
            }

            usize n = klib::min(count, block->size - *offset);
            if (dst) {
                memcpy(dst, block->data + *offset, n);
                dst += n;
            }
            count -= n;
            *offset += n;
        }
        return Error::NONE;
    }

    Error MetadataReader::read(void *buf, usize count) {
        return read_or_skip(cache, &block_offset, &offset, (u8*)buf, count);
    }

    Error MetadataReader::skip(usize count) {
        return read_or_skip(cache, &block_offset, &offset, nullptr, count);
    }

    Error read_lookup_entry(MetadataCache *cache, BlockSource *source, u64 table_start, u64 index, usize entry_size, void *out) {
        usize entries_per_block = format::metadata_size / entry_size;
        u64 pointer_offset = (index / entries_per_block) * sizeof(u64);
        if (klib::add_overflows(table_start, pointer_offset))
            return Error::UNEXPECTED_EOF;

        u64 block_start;
        if (auto err = source->read(table_start + pointer_offset, sizeof(block_start), &block_start); err != Error::NONE)
            return err;

        MetadataReader reader(cache, 0, block_start, (u16)((index % entries_per_block) * entry_size));
        return reader.read(out, entry_size);
    }
}
