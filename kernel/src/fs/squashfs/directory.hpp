#pragma once

#include <klib/cstdio.hpp>
#include <fs/squashfs/inode.hpp>

namespace squashfs {
    struct DirectoryEntry {
        char name[format::max_name_length + 1]; // null terminated
        usize name_length;
        InodeKind kind; // from the entry's type hint, OTHER for hints that are not known
        u16 type;
        u32 inode_number;
        InodeRef ref;
    };

    template<typename F> concept EntryVisitor = requires(F f, const DirectoryEntry &entry) { f(entry); };

    // reads the header at the current position and every entry that follows it.
    // remaining is the number of listing bytes not consumed yet.
    template<EntryVisitor Visit>
    Error visit_header_run(MetadataReader &reader, u32 *remaining, Visit &visit, bool *stop) {
        format::DirectoryHeader header;
        if (*remaining < sizeof(header))
            return Error::CORRUPT_BLOCK;
        if (auto err = reader.read(&header); err != Error::NONE)
            return err;
        *remaining -= sizeof(header);

        if (header.count >= format::max_directory_header_entries)
            return Error::CORRUPT_BLOCK;

        for (u32 i = 0; i <= header.count; i++) {
            format::DirectoryEntry raw;
            if (*remaining < sizeof(raw))
                return Error::CORRUPT_BLOCK;
            if (auto err = reader.read(&raw); err != Error::NONE)
                return err;
            *remaining -= sizeof(raw);

            usize name_length = raw.name_size + 1;
            if (name_length > format::max_name_length || *remaining < name_length)
                return Error::CORRUPT_BLOCK;

            DirectoryEntry entry;
            if (auto err = reader.read(entry.name, name_length); err != Error::NONE)
                return err;
            *remaining -= name_length;

            entry.name[name_length] = '\0';
            entry.name_length = name_length;
            entry.type = raw.type;
            entry.kind = inode_kind(raw.type);
            if (raw.type == 0 || raw.type > format::INODE_EXT_SOCKET)
                klib::printf("squashfs: entry \"%s\" has unknown type %u\n", entry.name, raw.type);
            entry.inode_number = (u32)((i64)header.inode_number + raw.inode_offset);
            entry.ref = { header.start_block, raw.offset };

            if (!visit(entry)) {
                *stop = true;
                return Error::NONE;
            }
        }
        return Error::NONE;
    }

    // calls visit for every entry of dir in on-disk order until it returns false
    template<EntryVisitor Visit>
    Error for_each_entry(MetadataCache *cache, const Superblock &superblock, const Inode &dir, Visit visit) {
        if (!dir.is_directory())
            return Error::NOT_A_DIRECTORY;

        MetadataReader reader(cache, superblock.directory_table, dir.directory.block, dir.directory.offset);
        u32 remaining = dir.directory.listing_size;
        bool stop = false;
        while (remaining > 0 && !stop)
            if (auto err = visit_header_run(reader, &remaining, visit, &stop); err != Error::NONE)
                return err;
        return Error::NONE;
    }

    // finds name (not null terminated) in dir and decodes its inode
    Error lookup(MetadataCache *cache, const Superblock &superblock, const Inode &dir, const char *name, usize name_length, Inode *out);

    // walks path starting at the directory at start, symlinks are not followed
    Error resolve(MetadataCache *cache, const Superblock &superblock, InodeRef start, const char *path, Inode *out);

    Error list(MetadataCache *cache, const Superblock &superblock, const Inode &dir, klib::Vector<DirectoryEntry> *out);
}
