#pragma once

#include <klib/common.hpp>
#include <fs/squashfs/error.hpp>

struct z_stream_s;

namespace squashfs {
    // decompressor for the single algorithm an archive declares in its superblock
    struct Codec {
        virtual ~Codec() {}

        virtual u16 id() const = 0;
        virtual const char* name() const = 0;

        // decompresses one complete block, the output must fit in dst_capacity
        virtual Error decompress(const u8 *src, usize src_len, u8 *dst, usize dst_capacity, usize *out_len) = 0;
    };

    struct ZlibCodec final : public Codec {
        ZlibCodec() {}
        ~ZlibCodec();

        ZlibCodec(const ZlibCodec &) = delete;
        ZlibCodec& operator=(const ZlibCodec &) = delete;

        Error init();

        u16 id() const override;
        const char* name() const override { return "gzip"; }
        Error decompress(const u8 *src, usize src_len, u8 *dst, usize dst_capacity, usize *out_len) override;

    private:
        z_stream_s *stream = nullptr;
    };

    const char* codec_name(u16 id);

    // UNSUPPORTED_CODEC for any id without a decompressor
    Error create_codec(u16 id, Codec **out);

    // stored blocks are copied verbatim, everything else goes through the codec
    Error decompress_block(Codec *codec, const u8 *src, usize src_len, bool stored, u8 *dst, usize dst_capacity, usize *out_len);
}
