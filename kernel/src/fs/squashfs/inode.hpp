#pragma once

#include <klib/vector.hpp>
#include <fs/squashfs/superblock.hpp>
#include <fs/squashfs/metadata.hpp>

namespace squashfs {
    enum class InodeKind : u8 {
        REGULAR,
        DIRECTORY,
        SYMLINK,
        OTHER, // devices, fifos and sockets
    };

    struct DirectoryStart {
        u32 block; // relative to the directory table
        u16 offset;
        u32 listing_size; // bytes of headers and entries, without the format's bias of 3
        u32 parent_inode;
        u16 index_count;
    };

    struct BlockList {
        u64 start; // absolute offset of the first data block
        klib::Vector<u32> sizes; // one size word per full block, format::data_stored marks stored blocks
        u32 fragment_index = format::invalid_fragment;
        u32 fragment_offset = 0;
        u64 sparse = 0;

        bool has_fragment() const { return fragment_index != format::invalid_fragment; }
    };

    // normalized form of every on-disk inode variant
    struct Inode {
        InodeKind kind;
        u16 type; // format::InodeType
        u16 mode;
        u16 uid_index;
        u16 gid_index;
        u32 modification_time;
        u32 inode_number;
        u32 link_count;
        u64 size;
        u32 xattr_index = format::invalid_xattr;
        InodeRef ref; // where this inode was decoded from

        DirectoryStart directory = {};
        BlockList blocks;
        klib::Vector<char> symlink_target; // not null terminated
        u32 device = 0;

        bool is_directory() const { return kind == InodeKind::DIRECTORY; }
        bool is_regular() const { return kind == InodeKind::REGULAR; }
    };

    InodeKind inode_kind(u16 type);

    // decodes the inode at ref into out, which is overwritten completely
    Error decode_inode(MetadataCache *cache, const Superblock &superblock, InodeRef ref, Inode *out);
}
