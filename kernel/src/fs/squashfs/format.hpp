#pragma once

#include <klib/common.hpp>

// on-disk layout of a SquashFS 4.0 archive, everything is little-endian
namespace squashfs::format {
    constexpr u32 magic = 0x73717368; // "hsqs"
    constexpr u16 version_major = 4;
    constexpr u16 version_minor = 0;

    constexpr u32 min_block_size = 4 * 1024;
    constexpr u32 max_block_size = 1024 * 1024;
    constexpr u16 max_block_log = 20;

    constexpr usize metadata_size = 8192; // decompressed size of a full metadata block
    constexpr u16 metadata_stored = 1 << 15; // metadata header: payload is not compressed
    constexpr u16 metadata_length_mask = 0x7FFF;

    constexpr u32 data_stored = 1 << 24; // block list and fragment entries: block is not compressed
    constexpr u32 data_length_mask = data_stored - 1;

    constexpr u64 invalid_table = ~0ull;
    constexpr u32 invalid_fragment = 0xFFFFFFFF;
    constexpr u32 invalid_xattr = 0xFFFFFFFF;

    constexpr usize max_name_length = 256;
    constexpr usize max_directory_header_entries = 256;
    constexpr usize max_symlink_length = 4096;
    constexpr u32 directory_size_bias = 3; // listing sizes count phantom "." and ".." entries

    enum Compression : u16 {
        COMPRESSION_GZIP = 1,
        COMPRESSION_LZMA = 2,
        COMPRESSION_LZO = 3,
        COMPRESSION_XZ = 4,
        COMPRESSION_LZ4 = 5,
        COMPRESSION_ZSTD = 6,
    };

    enum Flags : u16 {
        FLAG_UNCOMPRESSED_INODES = 0x0001,
        FLAG_UNCOMPRESSED_DATA = 0x0002,
        FLAG_CHECK = 0x0004,
        FLAG_UNCOMPRESSED_FRAGMENTS = 0x0008,
        FLAG_NO_FRAGMENTS = 0x0010,
        FLAG_ALWAYS_FRAGMENTS = 0x0020,
        FLAG_DUPLICATES = 0x0040,
        FLAG_EXPORTABLE = 0x0080,
        FLAG_UNCOMPRESSED_XATTRS = 0x0100,
        FLAG_NO_XATTRS = 0x0200,
        FLAG_COMPRESSOR_OPTIONS = 0x0400,
        FLAG_UNCOMPRESSED_IDS = 0x0800,
    };

    enum InodeType : u16 {
        INODE_DIRECTORY = 1,
        INODE_FILE = 2,
        INODE_SYMLINK = 3,
        INODE_BLOCK_DEVICE = 4,
        INODE_CHAR_DEVICE = 5,
        INODE_FIFO = 6,
        INODE_SOCKET = 7,
        INODE_EXT_DIRECTORY = 8,
        INODE_EXT_FILE = 9,
        INODE_EXT_SYMLINK = 10,
        INODE_EXT_BLOCK_DEVICE = 11,
        INODE_EXT_CHAR_DEVICE = 12,
        INODE_EXT_FIFO = 13,
        INODE_EXT_SOCKET = 14,
    };

    struct [[gnu::packed]] Superblock {
        u32 magic;
        u32 inode_count;
        u32 modification_time;
        u32 block_size;
        u32 fragment_count;
        u16 compression;
        u16 block_log;
        u16 flags;
        u16 id_count;
        u16 version_major;
        u16 version_minor;
        u64 root_inode; // packed inode reference
        u64 bytes_used;
        u64 id_table;
        u64 xattr_table;
        u64 inode_table;
        u64 directory_table;
        u64 fragment_table;
        u64 export_table;
    };
    static_assert(sizeof(Superblock) == 96);

    // fields every inode starts with
    struct [[gnu::packed]] InodeHeader {
        u16 type;
        u16 mode; // permission bits only
        u16 uid_index;
        u16 gid_index;
        u32 modification_time;
        u32 inode_number;
    };
    static_assert(sizeof(InodeHeader) == 16);

    struct [[gnu::packed]] DirectoryInode {
        u32 start_block; // relative to the directory table
        u32 link_count;
        u16 file_size;
        u16 offset;
        u32 parent_inode;
    };

    struct [[gnu::packed]] ExtDirectoryInode {
        u32 link_count;
        u32 file_size;
        u32 start_block;
        u32 parent_inode;
        u16 index_count;
        u16 offset;
        u32 xattr_index;
    };

    // followed by a u32 block size word per full data block
    struct [[gnu::packed]] FileInode {
        u32 start_block; // absolute
        u32 fragment_index;
        u32 fragment_offset;
        u32 file_size;
    };

    struct [[gnu::packed]] ExtFileInode {
        u64 start_block;
        u64 file_size;
        u64 sparse;
        u32 link_count;
        u32 fragment_index;
        u32 fragment_offset;
        u32 xattr_index;
    };

    // followed by target_size bytes of target, then a u32 xattr index for the extended type
    struct [[gnu::packed]] SymlinkInode {
        u32 link_count;
        u32 target_size;
    };

    struct [[gnu::packed]] DeviceInode {
        u32 link_count;
        u32 device;
    };

    struct [[gnu::packed]] ExtDeviceInode {
        u32 link_count;
        u32 device;
        u32 xattr_index;
    };

    struct [[gnu::packed]] IpcInode {
        u32 link_count;
    };

    struct [[gnu::packed]] ExtIpcInode {
        u32 link_count;
        u32 xattr_index;
    };

    struct [[gnu::packed]] DirectoryHeader {
        u32 count; // number of entries minus one
        u32 start_block; // inode table block holding every inode of this run
        u32 inode_number; // base for the entry deltas
    };

    // followed by name_size + 1 bytes of name
    struct [[gnu::packed]] DirectoryEntry {
        u16 offset; // inside the inode block
        i16 inode_offset; // signed delta from the header's inode number
        u16 type;
        u16 name_size; // name length minus one
    };

    struct [[gnu::packed]] FragmentEntry {
        u64 start_block;
        u32 size;
        u32 unused;
    };
    static_assert(sizeof(FragmentEntry) == 16);
}
