#include <fs/squashfs/archive.hpp>
#include <klib/cstdio.hpp>
#include <klib/cstring.hpp>

namespace squashfs {
    Error Archive::mount(BlockSource *source, const MountOptions &options, Archive **out) {
        Superblock sb;
        if (auto err = read_superblock(source, &sb); err != Error::NONE)
            return err;

        Codec *codec;
        if (auto err = create_codec(sb.compression, &codec); err != Error::NONE) {
            if (err == Error::UNSUPPORTED_CODEC)
                klib::printf("squashfs: no decompressor for %s (compression id %u)\n", codec_name(sb.compression), sb.compression);
            return err;
        }

        auto *cache = new MetadataCache(source, codec, sb.bytes_used, options.metadata_cache_blocks);
        if (!cache->valid()) {
            delete cache;
            delete codec;
            return Error::NO_MEMORY;
        }

        auto *archive = new Archive(source, sb, codec, cache, nullptr);
        archive->data = new DataReader(source, codec, cache, &archive->sb, options.cache_fragments);
        if (!archive->data->valid()) {
            delete archive;
            return Error::NO_MEMORY;
        }

        // the root has to decode, otherwise nothing in the archive is reachable
        Inode root;
        if (auto err = decode_inode(cache, archive->sb, sb.root, &root); err != Error::NONE) {
            delete archive;
            return err;
        }
        if (!root.is_directory()) {
            delete archive;
            return Error::NOT_A_DIRECTORY;
        }

        klib::printf("squashfs: mounted %s archive, %u inodes, block size %u, %lu bytes, %lu metadata blocks cached\n",
            codec->name(), sb.inode_count, sb.block_size, sb.bytes_used, (u64)cache->max_resident());

        *out = archive;
        return Error::NONE;
    }

    Archive::~Archive() {
        delete data;
        delete cache;
        delete codec;
    }

    Error Archive::resolve(const char *path, Inode *out) {
        return squashfs::resolve(cache, sb, sb.root, path, out);
    }

    Error Archive::open(const char *path, FileHandle **out) {
        auto *handle = new FileHandle();
        if (auto err = resolve(path, &handle->inode); err != Error::NONE) {
            delete handle;
            return err;
        }
        if (!handle->inode.is_regular()) {
            delete handle;
            return Error::IS_A_DIRECTORY;
        }
        *out = handle;
        return Error::NONE;
    }

    Error Archive::read(FileHandle *handle, u64 offset, usize length, void *buf) {
        return data->read_range(handle->inode, offset, length, buf);
    }

    void Archive::close(FileHandle *handle) {
        delete handle;
    }

    Error Archive::id(u16 index, u32 *out) {
        if (!sb.has_id_table() || index >= sb.id_count)
            return Error::CORRUPT_BLOCK;
        return read_lookup_entry(cache, source, sb.id_table, index, sizeof(u32), out);
    }

    Error Archive::stat(const char *path, Stat *out) {
        Inode inode;
        if (auto err = resolve(path, &inode); err != Error::NONE)
            return err;

        u32 uid, gid;
        if (auto err = id(inode.uid_index, &uid); err != Error::NONE)
            return err;
        if (auto err = id(inode.gid_index, &gid); err != Error::NONE)
            return err;

        *out = Stat {
            .kind = inode.kind,
            .type = inode.type,
            .size = inode.size,
            .permissions = inode.mode,
            .uid = uid,
            .gid = gid,
            .inode_number = inode.inode_number,
            .modification_time = inode.modification_time,
            .link_count = inode.link_count,
        };
        return Error::NONE;
    }

    Error Archive::readlink(const char *path, char *buf, usize size, usize *length) {
        Inode inode;
        if (auto err = resolve(path, &inode); err != Error::NONE)
            return err;
        if (inode.kind != InodeKind::SYMLINK)
            return Error::NOT_A_SYMLINK;

        usize n = klib::min(size, inode.symlink_target.size());
        if (n > 0)
            memcpy(buf, inode.symlink_target.data(), n);
        *length = n;
        return Error::NONE;
    }

    Error Archive::list(const char *path, klib::Vector<DirectoryEntry> *out) {
        Inode dir;
        if (auto err = resolve(path, &dir); err != Error::NONE)
            return err;
        return squashfs::list(cache, sb, dir, out);
    }

    Error Archive::inode_by_number(u32 number, Inode *out) {
        if (!sb.has_export_table() || number == 0 || number > sb.inode_count)
            return Error::NOT_FOUND;

        u64 raw;
        if (auto err = read_lookup_entry(cache, source, sb.export_table, number - 1, sizeof(u64), &raw); err != Error::NONE)
            return err;

        auto ref = InodeRef::from_raw(raw);
        if (sb.inode_table + ref.block >= sb.directory_table)
            return Error::CORRUPT_BLOCK;
        if (auto err = decode_inode(cache, sb, ref, out); err != Error::NONE)
            return err;
        if (out->inode_number != number)
            return Error::CORRUPT_BLOCK;
        return Error::NONE;
    }
}
