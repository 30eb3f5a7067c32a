#include <fs/squashfs/inode.hpp>
#include <klib/algorithm.hpp>

namespace squashfs {
    InodeKind inode_kind(u16 type) {
        switch (type) {
        case format::INODE_DIRECTORY:
        case format::INODE_EXT_DIRECTORY:
            return InodeKind::DIRECTORY;
        case format::INODE_FILE:
        case format::INODE_EXT_FILE:
            return InodeKind::REGULAR;
        case format::INODE_SYMLINK:
        case format::INODE_EXT_SYMLINK:
            return InodeKind::SYMLINK;
        default:
            return InodeKind::OTHER;
        }
    }

    static Error read_block_list(MetadataReader &reader, const Superblock &superblock, Inode *out) {
        u64 block_size = superblock.block_size;
        u64 count = out->blocks.has_fragment() ? out->size / block_size : klib::div_round_up(out->size, block_size);

        // a block list can never be larger than the archive it lives in
        if (count > superblock.bytes_used / sizeof(u32))
            return Error::CORRUPT_BLOCK;
        if (!out->blocks.sizes.resize(count))
            return Error::NO_MEMORY;

        if (count > 0)
            if (auto err = reader.read(out->blocks.sizes.data(), count * sizeof(u32)); err != Error::NONE)
                return err;

        for (u32 word : out->blocks.sizes)
            if ((word & format::data_length_mask) > block_size)
                return Error::CORRUPT_BLOCK;
        return Error::NONE;
    }

    static Error read_symlink_target(MetadataReader &reader, u32 target_size, Inode *out) {
        if (target_size > format::max_symlink_length)
            return Error::CORRUPT_BLOCK;
        if (!out->symlink_target.resize(target_size))
            return Error::NO_MEMORY;
        if (target_size > 0)
            return reader.read(out->symlink_target.data(), target_size);
        return Error::NONE;
    }

    Error decode_inode(MetadataCache *cache, const Superblock &superblock, InodeRef ref, Inode *out) {
        if (ref.offset >= format::metadata_size)
            return Error::CORRUPT_BLOCK;

        MetadataReader reader(cache, superblock.inode_table, ref.block, ref.offset);

        format::InodeHeader header;
        if (auto err = reader.read(&header); err != Error::NONE)
            return err;

        out->kind = inode_kind(header.type);
        out->type = header.type;
        out->mode = header.mode;
        out->uid_index = header.uid_index;
        out->gid_index = header.gid_index;
        out->modification_time = header.modification_time;
        out->inode_number = header.inode_number;
        out->link_count = 1;
        out->size = 0;
        out->xattr_index = format::invalid_xattr;
        out->ref = ref;
        out->directory = {};
        out->blocks.start = 0;
        out->blocks.sizes.clear();
        out->blocks.fragment_index = format::invalid_fragment;
        out->blocks.fragment_offset = 0;
        out->blocks.sparse = 0;
        out->symlink_target.clear();
        out->device = 0;

        switch (header.type) {
        case format::INODE_DIRECTORY: {
            format::DirectoryInode dir;
            if (auto err = reader.read(&dir); err != Error::NONE)
                return err;
            out->link_count = dir.link_count;
            out->directory.block = dir.start_block;
            out->directory.offset = dir.offset;
            out->directory.listing_size = dir.file_size > format::directory_size_bias ? dir.file_size - format::directory_size_bias : 0;
            out->directory.parent_inode = dir.parent_inode;
            out->size = dir.file_size;
            return Error::NONE;
        }
        case format::INODE_EXT_DIRECTORY: {
            format::ExtDirectoryInode dir;
            if (auto err = reader.read(&dir); err != Error::NONE)
                return err;
            out->link_count = dir.link_count;
            out->directory.block = dir.start_block;
            out->directory.offset = dir.offset;
            out->directory.listing_size = dir.file_size > format::directory_size_bias ? dir.file_size - format::directory_size_bias : 0;
            out->directory.parent_inode = dir.parent_inode;
            out->directory.index_count = dir.index_count;
            out->xattr_index = dir.xattr_index;
            out->size = dir.file_size;
            // the directory index that follows only speeds up lookups in huge directories, it is not read
            return Error::NONE;
        }
        case format::INODE_FILE: {
            format::FileInode file;
            if (auto err = reader.read(&file); err != Error::NONE)
                return err;
            out->size = file.file_size;
            out->blocks.start = file.start_block;
            out->blocks.fragment_index = file.fragment_index;
            out->blocks.fragment_offset = file.fragment_offset;
            return read_block_list(reader, superblock, out);
        }
        case format::INODE_EXT_FILE: {
            format::ExtFileInode file;
            if (auto err = reader.read(&file); err != Error::NONE)
                return err;
            out->size = file.file_size;
            out->link_count = file.link_count;
            out->xattr_index = file.xattr_index;
            out->blocks.start = file.start_block;
            out->blocks.sparse = file.sparse;
            out->blocks.fragment_index = file.fragment_index;
            out->blocks.fragment_offset = file.fragment_offset;
            return read_block_list(reader, superblock, out);
        }
        case format::INODE_SYMLINK:
        case format::INODE_EXT_SYMLINK: {
            format::SymlinkInode link;
            if (auto err = reader.read(&link); err != Error::NONE)
                return err;
            out->link_count = link.link_count;
            out->size = link.target_size;
            if (auto err = read_symlink_target(reader, link.target_size, out); err != Error::NONE)
                return err;
            if (header.type == format::INODE_EXT_SYMLINK)
                return reader.read(&out->xattr_index);
            return Error::NONE;
        }
        case format::INODE_BLOCK_DEVICE:
        case format::INODE_CHAR_DEVICE: {
            format::DeviceInode dev;
            if (auto err = reader.read(&dev); err != Error::NONE)
                return err;
            out->link_count = dev.link_count;
            out->device = dev.device;
            return Error::NONE;
        }
        case format::INODE_EXT_BLOCK_DEVICE:
        case format::INODE_EXT_CHAR_DEVICE: {
            format::ExtDeviceInode dev;
            if (auto err = reader.read(&dev); err != Error::NONE)
                return err;
            out->link_count = dev.link_count;
            out->device = dev.device;
            out->xattr_index = dev.xattr_index;
            return Error::NONE;
        }
        case format::INODE_FIFO:
        case format::INODE_SOCKET: {
            format::IpcInode ipc;
            if (auto err = reader.read(&ipc); err != Error::NONE)
                return err;
            out->link_count = ipc.link_count;
            return Error::NONE;
        }
        case format::INODE_EXT_FIFO:
        case format::INODE_EXT_SOCKET: {
            format::ExtIpcInode ipc;
            if (auto err = reader.read(&ipc); err != Error::NONE)
                return err;
            out->link_count = ipc.link_count;
            out->xattr_index = ipc.xattr_index;
            return Error::NONE;
        }
        default:
            return Error::UNSUPPORTED_INODE_TYPE;
        }
    }
}
