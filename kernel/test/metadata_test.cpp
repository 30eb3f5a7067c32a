#include <fixture.hpp>

using namespace reeftest;
using squashfs::Error;
namespace format = squashfs::format;

namespace {
    class MetadataTest : public ::testing::Test {
    protected:
        squashfs::Codec *codec = nullptr;
        std::vector<u8> image;
        std::vector<u64> block_offsets;
        std::unique_ptr<squashfs::MemoryBlockSource> source;

        void SetUp() override {
            ASSERT_EQ(squashfs::create_codec(format::COMPRESSION_GZIP, &codec), Error::NONE);
        }

        void TearDown() override {
            delete codec;
        }

        void add_block(const std::vector<u8> &payload, bool compress) {
            block_offsets.push_back(image.size());
            auto block = encode_metadata_block(payload, compress);
            image.insert(image.end(), block.begin(), block.end());
        }

        void add_raw(const std::vector<u8> &bytes) {
            block_offsets.push_back(image.size());
            image.insert(image.end(), bytes.begin(), bytes.end());
        }

        std::unique_ptr<squashfs::MetadataCache> make_cache(usize capacity = 16) {
            source = std::make_unique<squashfs::MemoryBlockSource>(image.data(), image.size());
            return std::make_unique<squashfs::MetadataCache>(source.get(), codec, image.size(), capacity);
        }
    };

    std::vector<u8> text(usize size, char first) {
        std::vector<u8> out(size);
        for (usize i = 0; i < size; i++)
            out[i] = first + (i % 26);
        return out;
    }
}

TEST_F(MetadataTest, ReadsACompressedBlock) {
    auto payload = text(3000, 'a');
    add_block(payload, true);
    ASSERT_LT(image.size(), payload.size());
    auto cache = make_cache();

    const squashfs::MetadataBlock *block;
    ASSERT_EQ(cache->get(0, &block), Error::NONE);
    EXPECT_EQ(block->offset, 0u);
    EXPECT_EQ(block->size, 3000);
    EXPECT_EQ(block->next_offset(), image.size());

    std::vector<u8> out(3000);
    squashfs::MetadataReader reader(cache.get(), 0, 0, 0);
    ASSERT_EQ(reader.read(out.data(), out.size()), Error::NONE);
    EXPECT_EQ(out, payload);
}

TEST_F(MetadataTest, ReadsAStoredBlock) {
    auto payload = pattern_bytes(500, 9);
    add_block(payload, false);
    EXPECT_EQ(peek<u16>(image, 0), 500 | format::metadata_stored);
    auto cache = make_cache();

    std::vector<u8> out(500);
    squashfs::MetadataReader reader(cache.get(), 0, 0, 0);
    ASSERT_EQ(reader.read(out.data(), out.size()), Error::NONE);
    EXPECT_EQ(out, payload);
}

TEST_F(MetadataTest, RecordsStraddleBlocks) {
    auto first = text(format::metadata_size, 'a');
    auto second = text(100, 'A');
    add_block(first, true);
    add_block(second, false);
    auto cache = make_cache();

    u8 out[10];
    squashfs::MetadataReader reader(cache.get(), 0, 0, format::metadata_size - 2);
    ASSERT_EQ(reader.read(out, sizeof(out)), Error::NONE);
    EXPECT_EQ(out[0], first[8190]);
    EXPECT_EQ(out[1], first[8191]);
    for (usize i = 2; i < 10; i++)
        EXPECT_EQ(out[i], second[i - 2]);
    EXPECT_EQ(reader.position_block(), block_offsets[1]);
    EXPECT_EQ(reader.position_offset(), 8u);
}

TEST_F(MetadataTest, ReadingAtTheEndOfABlockMovesToTheNext) {
    add_block(text(100, 'a'), false);
    add_block(text(100, 'A'), false);
    auto cache = make_cache();

    u8 c;
    squashfs::MetadataReader reader(cache.get(), 0, 0, 100);
    ASSERT_EQ(reader.read(&c), Error::NONE);
    EXPECT_EQ(c, 'A');
}

TEST_F(MetadataTest, SameStartGivesSameBytes) {
    add_block(text(format::metadata_size, 'a'), true);
    add_block(pattern_bytes(4000, 2), true);
    auto cache = make_cache(1);

    std::vector<u8> a(600), b(600);
    squashfs::MetadataReader first(cache.get(), 0, 0, 7900);
    squashfs::MetadataReader second(cache.get(), 0, 0, 7900);
    ASSERT_EQ(first.read(a.data(), a.size()), Error::NONE);
    ASSERT_EQ(second.read(b.data(), b.size()), Error::NONE);
    EXPECT_EQ(a, b);
}

TEST_F(MetadataTest, SkipMatchesRead) {
    add_block(text(format::metadata_size, 'a'), true);
    add_block(text(2000, 'A'), true);
    auto cache = make_cache();

    std::vector<u8> all(9000);
    squashfs::MetadataReader whole(cache.get(), 0, 0, 0);
    ASSERT_EQ(whole.read(all.data(), all.size()), Error::NONE);

    std::vector<u8> tail(200);
    squashfs::MetadataReader skipping(cache.get(), 0, 0, 0);
    ASSERT_EQ(skipping.skip(8800), Error::NONE);
    ASSERT_EQ(skipping.read(tail.data(), tail.size()), Error::NONE);
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), all.begin() + 8800));
}

TEST_F(MetadataTest, TableStartIsAddedToTheBlock) {
    image.resize(64, 0xEE);
    add_block(text(10, 'a'), false);
    auto cache = make_cache();

    u8 out[3];
    squashfs::MetadataReader reader(cache.get(), 64, 0, 2);
    ASSERT_EQ(reader.read(out, sizeof(out)), Error::NONE);
    EXPECT_EQ(out[0], 'c');
    EXPECT_TRUE(cache->contains(64));
}

TEST_F(MetadataTest, ZeroLengthHeaderIsCorrupt) {
    add_raw({ 0x00, 0x00, 1, 2, 3, 4 });
    auto cache = make_cache();
    const squashfs::MetadataBlock *block;
    EXPECT_EQ(cache->get(0, &block), Error::CORRUPT_BLOCK);
}

TEST_F(MetadataTest, OversizedHeaderIsCorrupt) {
    std::vector<u8> raw(2 + 8193, 0);
    raw[0] = 8193 & 0xFF;
    raw[1] = (8193 >> 8) | 0x80;
    add_raw(raw);
    auto cache = make_cache();
    const squashfs::MetadataBlock *block;
    EXPECT_EQ(cache->get(0, &block), Error::CORRUPT_BLOCK);
}

TEST_F(MetadataTest, PayloadPastTheEndIsUnexpectedEof) {
    add_raw({ 100, 0x80, 1, 2, 3, 4, 5 });
    auto cache = make_cache();
    const squashfs::MetadataBlock *block;
    EXPECT_EQ(cache->get(0, &block), Error::UNEXPECTED_EOF);
    EXPECT_EQ(cache->get(image.size(), &block), Error::UNEXPECTED_EOF);
    EXPECT_EQ(cache->get(image.size() + 1000, &block), Error::UNEXPECTED_EOF);
}

TEST_F(MetadataTest, ChainRunningOffTheEndIsUnexpectedEof) {
    add_block(text(100, 'a'), false);
    auto cache = make_cache();

    std::vector<u8> out(200);
    squashfs::MetadataReader reader(cache.get(), 0, 0, 0);
    EXPECT_EQ(reader.read(out.data(), out.size()), Error::UNEXPECTED_EOF);
}

TEST_F(MetadataTest, UndecodableBlockIsNeverCached) {
    auto garbage = pattern_bytes(40, 5);
    std::vector<u8> raw = { 40, 0x00 };
    raw.insert(raw.end(), garbage.begin(), garbage.end());
    add_raw(raw);
    auto cache = make_cache();

    const squashfs::MetadataBlock *block;
    EXPECT_EQ(cache->get(0, &block), Error::CORRUPT_BLOCK);
    EXPECT_FALSE(cache->contains(0));
    EXPECT_EQ(cache->resident(), 0u);
    EXPECT_EQ(cache->get(0, &block), Error::CORRUPT_BLOCK);
}

TEST_F(MetadataTest, BlockInflatingPastTheMaximumIsCorrupt) {
    auto compressed = zlib_compress(text(9000, 'a'));
    std::vector<u8> raw(2);
    patch<u16>(raw, 0, compressed.size());
    raw.insert(raw.end(), compressed.begin(), compressed.end());
    add_raw(raw);
    auto cache = make_cache();

    const squashfs::MetadataBlock *block;
    EXPECT_EQ(cache->get(0, &block), Error::CORRUPT_BLOCK);
}

TEST_F(MetadataTest, OffsetPastTheBlockIsCorrupt) {
    add_block(text(100, 'a'), false);
    add_block(text(100, 'A'), false);
    auto cache = make_cache();

    u8 c;
    squashfs::MetadataReader reader(cache.get(), 0, 0, 101);
    EXPECT_EQ(reader.read(&c), Error::CORRUPT_BLOCK);
}

TEST_F(MetadataTest, EvictsTheLeastRecentlyUsedBlock) {
    for (char c = 'a'; c < 'e'; c++)
        add_block(text(16, c), false);
    auto cache = make_cache(2);
    EXPECT_EQ(cache->max_resident(), 2u);

    const squashfs::MetadataBlock *block;
    ASSERT_EQ(cache->get(block_offsets[0], &block), Error::NONE);
    ASSERT_EQ(cache->get(block_offsets[1], &block), Error::NONE);
    ASSERT_EQ(cache->get(block_offsets[0], &block), Error::NONE);
    ASSERT_EQ(cache->get(block_offsets[2], &block), Error::NONE);
    EXPECT_EQ(block->data[0], 'c');

    EXPECT_TRUE(cache->contains(block_offsets[0]));
    EXPECT_FALSE(cache->contains(block_offsets[1]));
    EXPECT_TRUE(cache->contains(block_offsets[2]));
    EXPECT_EQ(cache->resident(), 2u);

    auto &stats = cache->statistics();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 3u);
    EXPECT_EQ(stats.evictions, 1u);
}

TEST_F(MetadataTest, FailedLoadKeepsResidentBlocks) {
    add_block(text(16, 'a'), false);
    add_block(text(16, 'b'), false);
    add_raw({ 0x00, 0x00 });
    auto cache = make_cache(2);

    const squashfs::MetadataBlock *block;
    ASSERT_EQ(cache->get(block_offsets[0], &block), Error::NONE);
    ASSERT_EQ(cache->get(block_offsets[1], &block), Error::NONE);
    EXPECT_EQ(cache->get(block_offsets[2], &block), Error::CORRUPT_BLOCK);

    EXPECT_EQ(cache->resident(), 2u);
    EXPECT_TRUE(cache->contains(block_offsets[0]));
    EXPECT_TRUE(cache->contains(block_offsets[1]));
    EXPECT_EQ(cache->statistics().evictions, 0u);
}

TEST_F(MetadataTest, ResidencyNeverExceedsTheCapacity) {
    for (int i = 0; i < 40; i++)
        add_block(pattern_bytes(200, i), true);
    auto cache = make_cache(3);

    const squashfs::MetadataBlock *block;
    for (int round = 0; round < 3; round++) {
        for (u64 offset : block_offsets) {
            ASSERT_EQ(cache->get(offset, &block), Error::NONE);
            EXPECT_LE(cache->resident(), 3u);
        }
    }
    EXPECT_EQ(cache->statistics().misses, 120u);
    EXPECT_EQ(cache->statistics().evictions, 117u);
}

TEST_F(MetadataTest, MissesAndEvictionsDoNotAllocate) {
    for (int i = 0; i < 40; i++)
        add_block(text(3000, 'a' + i % 20), true);
    auto cache = make_cache(2);

    // the first inflate sets up the codec's window
    const squashfs::MetadataBlock *block;
    ASSERT_EQ(cache->get(block_offsets[0], &block), Error::NONE);

    usize failures = 0;
    usize before = allocation_count();
    for (int round = 0; round < 5; round++)
        for (u64 offset : block_offsets)
            if (cache->get(offset, &block) != Error::NONE)
                failures++;
    usize allocated = allocation_count() - before;

    EXPECT_EQ(failures, 0u);
    EXPECT_EQ(allocated, 0u);
    EXPECT_EQ(cache->statistics().misses, 200u);
    EXPECT_EQ(cache->statistics().evictions, 198u);
    EXPECT_EQ(cache->resident(), 2u);
}

TEST_F(MetadataTest, ZeroCapacityStillHoldsOneBlock) {
    add_block(text(16, 'a'), false);
    auto cache = make_cache(0);
    ASSERT_TRUE(cache->valid());
    EXPECT_EQ(cache->max_resident(), 1u);

    const squashfs::MetadataBlock *block;
    ASSERT_EQ(cache->get(0, &block), Error::NONE);
    ASSERT_EQ(cache->get(0, &block), Error::NONE);
    EXPECT_EQ(cache->statistics().hits, 1u);
}

TEST_F(MetadataTest, LookupTablesSpanSeveralBlocks) {
    // 2048 u32 entries fit in one block
    std::vector<u8> entries;
    for (u32 i = 0; i < 3000; i++) {
        u32 value = i * 7;
        entries.insert(entries.end(), (u8*)&value, (u8*)&value + sizeof(value));
    }
    add_block(std::vector<u8>(entries.begin(), entries.begin() + format::metadata_size), true);
    add_block(std::vector<u8>(entries.begin() + format::metadata_size, entries.end()), true);
    u64 table_start = image.size();
    for (u64 offset : std::vector<u64>(block_offsets))
        image.insert(image.end(), (u8*)&offset, (u8*)&offset + sizeof(offset));
    auto cache = make_cache();

    for (u32 index : { 0u, 5u, 2047u, 2048u, 2500u, 2999u }) {
        u32 value = 0;
        ASSERT_EQ(squashfs::read_lookup_entry(cache.get(), source.get(), table_start, index, sizeof(u32), &value), Error::NONE) << index;
        EXPECT_EQ(value, index * 7);
    }

    u32 value;
    EXPECT_EQ(squashfs::read_lookup_entry(cache.get(), source.get(), table_start, 5000, sizeof(u32), &value), Error::UNEXPECTED_EOF);
}
