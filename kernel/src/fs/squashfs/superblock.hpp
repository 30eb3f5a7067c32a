#pragma once

#include <fs/squashfs/format.hpp>
#include <fs/squashfs/block_source.hpp>

namespace squashfs {
    // address of an inode or directory record: metadata block relative to its table, offset inside the decompressed block
    struct InodeRef {
        u64 block;
        u16 offset;

        static constexpr InodeRef from_raw(u64 raw) { return { raw >> 16, (u16)(raw & 0xFFFF) }; }
        constexpr u64 raw() const { return (block << 16) | offset; }

        friend constexpr bool operator ==(const InodeRef &a, const InodeRef &b) { return a.block == b.block && a.offset == b.offset; }
        friend constexpr bool operator !=(const InodeRef &a, const InodeRef &b) { return !(a == b); }
    };

    struct Features {
        bool uncompressed_inodes;
        bool uncompressed_data;
        bool uncompressed_fragments;
        bool no_fragments;
        bool always_fragments;
        bool duplicates;
        bool exportable;
        bool uncompressed_xattrs;
        bool no_xattrs;
        bool compressor_options;
        bool uncompressed_ids;
    };

    struct Superblock {
        u32 inode_count;
        u32 modification_time;
        u32 block_size;
        u16 block_log;
        u32 fragment_count;
        u16 compression;
        u16 flags;
        u16 id_count;
        InodeRef root;
        u64 bytes_used;
        u64 inode_table;
        u64 directory_table;
        u64 fragment_table; // format::invalid_table when absent
        u64 export_table;
        u64 id_table;
        u64 xattr_table;

        bool has_fragments() const { return fragment_table != format::invalid_table && fragment_count > 0; }
        bool has_export_table() const { return export_table != format::invalid_table; }
        bool has_id_table() const { return id_table != format::invalid_table && id_count > 0; }
        Features features() const;
    };

    // reads and validates the header at the start of source, reading nothing else if the magic is wrong
    Error read_superblock(BlockSource *source, Superblock *out);
}
