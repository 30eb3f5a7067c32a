#include <fs/squashfs/superblock.hpp>
#include <klib/algorithm.hpp>

namespace squashfs {
    Features Superblock::features() const {
        return Features {
            .uncompressed_inodes = (flags & format::FLAG_UNCOMPRESSED_INODES) != 0,
            .uncompressed_data = (flags & format::FLAG_UNCOMPRESSED_DATA) != 0,
            .uncompressed_fragments = (flags & format::FLAG_UNCOMPRESSED_FRAGMENTS) != 0,
            .no_fragments = (flags & format::FLAG_NO_FRAGMENTS) != 0,
            .always_fragments = (flags & format::FLAG_ALWAYS_FRAGMENTS) != 0,
            .duplicates = (flags & format::FLAG_DUPLICATES) != 0,
            .exportable = (flags & format::FLAG_EXPORTABLE) != 0,
            .uncompressed_xattrs = (flags & format::FLAG_UNCOMPRESSED_XATTRS) != 0,
            .no_xattrs = (flags & format::FLAG_NO_XATTRS) != 0,
            .compressor_options = (flags & format::FLAG_COMPRESSOR_OPTIONS) != 0,
            .uncompressed_ids = (flags & format::FLAG_UNCOMPRESSED_IDS) != 0,
        };
    }

    static bool optional_table_valid(u64 start, u64 bytes_used) {
        return start == format::invalid_table || start < bytes_used;
    }

    Error read_superblock(BlockSource *source, Superblock *out) {
        if (source->size() < sizeof(format::Superblock))
            return Error::INVALID_SUPERBLOCK;

        format::Superblock raw;
        if (source->read(0, sizeof(raw), &raw) != Error::NONE)
            return Error::INVALID_SUPERBLOCK;

        if (raw.magic != format::magic)
            return Error::INVALID_SUPERBLOCK;
        if (raw.version_major != format::version_major || raw.version_minor != format::version_minor)
            return Error::INVALID_SUPERBLOCK;

        if (raw.block_size < format::min_block_size || raw.block_size > format::max_block_size)
            return Error::INVALID_SUPERBLOCK;
        if (!klib::is_power_of_two(raw.block_size))
            return Error::INVALID_SUPERBLOCK;
        if (raw.block_log > format::max_block_log || (1u << raw.block_log) != raw.block_size)
            return Error::INVALID_SUPERBLOCK;

        if (raw.bytes_used < sizeof(format::Superblock) || raw.bytes_used > source->size())
            return Error::INVALID_SUPERBLOCK;
        if (raw.inode_table < sizeof(format::Superblock) || raw.inode_table >= raw.directory_table || raw.directory_table >= raw.bytes_used)
            return Error::INVALID_SUPERBLOCK;

        auto root = InodeRef::from_raw(raw.root_inode);
        if (root.offset >= format::metadata_size || raw.inode_table + root.block >= raw.directory_table)
            return Error::INVALID_SUPERBLOCK;

        if (!optional_table_valid(raw.fragment_table, raw.bytes_used) || !optional_table_valid(raw.export_table, raw.bytes_used)
            || !optional_table_valid(raw.id_table, raw.bytes_used) || !optional_table_valid(raw.xattr_table, raw.bytes_used))
            return Error::INVALID_SUPERBLOCK;

        *out = Superblock {
            .inode_count = raw.inode_count,
            .modification_time = raw.modification_time,
            .block_size = raw.block_size,
            .block_log = raw.block_log,
            .fragment_count = raw.fragment_count,
            .compression = raw.compression,
            .flags = raw.flags,
            .id_count = raw.id_count,
            .root = root,
            .bytes_used = raw.bytes_used,
            .inode_table = raw.inode_table,
            .directory_table = raw.directory_table,
            .fragment_table = raw.fragment_table,
            .export_table = raw.export_table,
            .id_table = raw.id_table,
            .xattr_table = raw.xattr_table,
        };
        return Error::NONE;
    }
}
