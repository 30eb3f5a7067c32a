#pragma once

#include <image_builder.hpp>
#include <host_support.hpp>
#include <fs/squashfs/archive.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <ostream>

namespace squashfs {
    inline void PrintTo(Error error, std::ostream *os) {
        *os << error_string(error);
    }
}

namespace reeftest {
    // the pieces below the archive, for tests of a single layer
    struct DriverParts {
        std::vector<u8> bytes;
        std::unique_ptr<squashfs::MemoryBlockSource> source;
        squashfs::Superblock superblock = {};
        squashfs::Codec *codec = nullptr;
        std::unique_ptr<squashfs::MetadataCache> cache;

        DriverParts() = default;
        DriverParts(const DriverParts &) = delete;

        ~DriverParts() {
            cache.reset();
            delete codec;
        }

        squashfs::Error load(std::vector<u8> image, usize cache_blocks = 16) {
            bytes = std::move(image);
            source = std::make_unique<squashfs::MemoryBlockSource>(bytes.data(), bytes.size());
            if (auto err = squashfs::read_superblock(source.get(), &superblock); err != squashfs::Error::NONE)
                return err;
            if (auto err = squashfs::create_codec(superblock.compression, &codec); err != squashfs::Error::NONE)
                return err;
            cache = std::make_unique<squashfs::MetadataCache>(source.get(), codec, superblock.bytes_used, cache_blocks);
            return squashfs::Error::NONE;
        }

        squashfs::Error root(squashfs::Inode *out) {
            return squashfs::decode_inode(cache.get(), superblock, superblock.root, out);
        }
    };

    // an image and the archive mounted over it
    struct MountedImage {
        std::vector<u8> bytes;
        std::unique_ptr<squashfs::MemoryBlockSource> source;
        squashfs::Archive *archive = nullptr;

        MountedImage() = default;
        MountedImage(const MountedImage &) = delete;

        ~MountedImage() {
            delete archive;
        }

        squashfs::Error mount(std::vector<u8> image, const squashfs::MountOptions &options = {}) {
            bytes = std::move(image);
            source = std::make_unique<squashfs::MemoryBlockSource>(bytes.data(), bytes.size());
            return squashfs::Archive::mount(source.get(), options, &archive);
        }

        std::vector<u8> read_file(const char *path) {
            squashfs::FileHandle *handle;
            auto err = archive->open(path, &handle);
            EXPECT_EQ(err, squashfs::Error::NONE) << path;
            if (err != squashfs::Error::NONE)
                return {};

            std::vector<u8> out(handle->inode.size);
            err = archive->read(handle, 0, out.size(), out.data());
            EXPECT_EQ(err, squashfs::Error::NONE) << path;
            archive->close(handle);
            return out;
        }
    };

    template<typename T>
    void patch(std::vector<u8> &bytes, u64 offset, T value) {
        std::memcpy(bytes.data() + offset, &value, sizeof(T));
    }

    template<typename T>
    T peek(const std::vector<u8> &bytes, u64 offset) {
        T value;
        std::memcpy(&value, bytes.data() + offset, sizeof(T));
        return value;
    }

    inline std::vector<u8> bytes_of(const std::string &str) {
        return std::vector<u8>(str.begin(), str.end());
    }
}
