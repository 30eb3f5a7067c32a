#include <fs/squashfs/codec.hpp>
#include <fs/squashfs/format.hpp>
#include <klib/cstdlib.hpp>
#include <klib/cstring.hpp>
#include <zlib.h>

namespace squashfs {
    static voidpf zlib_alloc(voidpf, uInt items, uInt size) {
        return klib::calloc((usize)items * size);
    }

    static void zlib_free(voidpf, voidpf address) {
        klib::free(address);
    }

    ZlibCodec::~ZlibCodec() {
        if (stream) {
            inflateEnd(stream);
            delete stream;
        }
    }

    Error ZlibCodec::init() {
        stream = new z_stream {};
        stream->zalloc = zlib_alloc;
        stream->zfree = zlib_free;
        stream->opaque = nullptr;
        if (inflateInit(stream) != Z_OK) {
            delete stream;
            stream = nullptr;
            return Error::NO_MEMORY;
        }
        return Error::NONE;
    }

    u16 ZlibCodec::id() const {
        return format::COMPRESSION_GZIP;
    }

    Error ZlibCodec::decompress(const u8 *src, usize src_len, u8 *dst, usize dst_capacity, usize *out_len) {
        if (inflateReset(stream) != Z_OK)
            return Error::CORRUPT_BLOCK;

        stream->next_in = const_cast<Bytef*>(src);
        stream->avail_in = src_len;
        stream->next_out = dst;
        stream->avail_out = dst_capacity;

        // anything short of a complete stream that fits the output is a broken block
        if (inflate(stream, Z_FINISH) != Z_STREAM_END)
            return Error::CORRUPT_BLOCK;

        *out_len = stream->total_out;
        return Error::NONE;
    }

    const char* codec_name(u16 id) {
        switch (id) {
        case format::COMPRESSION_GZIP: return "gzip";
        case format::COMPRESSION_LZMA: return "lzma";
        case format::COMPRESSION_LZO: return "lzo";
        case format::COMPRESSION_XZ: return "xz";
        case format::COMPRESSION_LZ4: return "lz4";
        case format::COMPRESSION_ZSTD: return "zstd";
        default: return "unknown";
        }
    }

    Error create_codec(u16 id, Codec **out) {
        if (id != format::COMPRESSION_GZIP)
            return Error::UNSUPPORTED_CODEC;

        auto *codec = new ZlibCodec();
        if (auto err = codec->init(); err != Error::NONE) {
            delete codec;
            return err;
        }
        *out = codec;
        return Error::NONE;
    }

    Error decompress_block(Codec *codec, const u8 *src, usize src_len, bool stored, u8 *dst, usize dst_capacity, usize *out_len) {
        if (stored) {
            if (src_len > dst_capacity)
                return Error::CORRUPT_BLOCK;
            memcpy(dst, src, src_len);
            *out_len = src_len;
            return Error::NONE;
        }
        return codec->decompress(src, src_len, dst, dst_capacity, out_len);
    }
}
