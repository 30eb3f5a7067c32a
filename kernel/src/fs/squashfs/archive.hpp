#pragma once

#include <fs/squashfs/directory.hpp>
#include <fs/squashfs/data.hpp>

namespace squashfs {
    struct MountOptions {
        usize metadata_cache_blocks = 16; // decompressed metadata blocks kept resident, at least 1
        bool cache_fragments = true; // keep the last decompressed fragment block
    };

    struct Stat {
        InodeKind kind;
        u16 type;
        u64 size;
        u16 permissions;
        u32 uid;
        u32 gid;
        u32 inode_number;
        u32 modification_time;
        u32 link_count;
    };

    // an open regular file
    struct FileHandle {
        Inode inode;
    };

    // a mounted read-only archive. nothing is ever written back to the source.
    class Archive {
        BlockSource *source;
        Superblock sb;
        Codec *codec;
        MetadataCache *cache;
        DataReader *data;

        Archive(BlockSource *source, const Superblock &sb, Codec *codec, MetadataCache *cache, DataReader *data)
            : source(source), sb(sb), codec(codec), cache(cache), data(data) {}

        Error id(u16 index, u32 *out);

    public:
        ~Archive();

        Archive(const Archive &) = delete;
        Archive& operator=(const Archive &) = delete;

        static Error mount(BlockSource *source, const MountOptions &options, Archive **out);

        // paths are relative to the root of the archive, a leading '/' is optional
        Error resolve(const char *path, Inode *out);

        Error open(const char *path, FileHandle **out);
        Error read(FileHandle *handle, u64 offset, usize length, void *buf);
        void close(FileHandle *handle);

        // uid and gid come from the id table, an index outside it fails with CORRUPT_BLOCK
        // even though the inode itself decoded
        Error stat(const char *path, Stat *out);

        // copies at most size bytes of the target without a terminator, like readlink(2)
        Error readlink(const char *path, char *buf, usize size, usize *length);

        Error list(const char *path, klib::Vector<DirectoryEntry> *out);

        // needs the export table, NOT_FOUND without one
        Error inode_by_number(u32 number, Inode *out);

        const Superblock& superblock() const { return sb; }
        const MetadataCache& metadata_cache() const { return *cache; }
        DataReader& data_reader() { return *data; }
    };
}
