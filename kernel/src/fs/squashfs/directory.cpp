#include <fs/squashfs/directory.hpp>
#include <klib/cstring.hpp>

namespace squashfs {
    Error lookup(MetadataCache *cache, const Superblock &superblock, const Inode &dir, const char *name, usize name_length, Inode *out) {
        if (name_length == 0 || name_length > format::max_name_length)
            return dir.is_directory() ? Error::NOT_FOUND : Error::NOT_A_DIRECTORY;

        bool found = false;
        DirectoryEntry match;
        auto walk_err = for_each_entry(cache, superblock, dir, [&](const DirectoryEntry &entry) {
            if (entry.name_length != name_length || memcmp(entry.name, name, name_length) != 0)
                return true;
            match = entry;
            found = true;
            return false;
        });
        if (walk_err != Error::NONE)
            return walk_err;
        if (!found)
            return Error::NOT_FOUND;

        if (auto err = decode_inode(cache, superblock, match.ref, out); err != Error::NONE)
            return err;
        if (out->inode_number != match.inode_number)
            return Error::CORRUPT_BLOCK;
        return Error::NONE;
    }

    Error resolve(MetadataCache *cache, const Superblock &superblock, InodeRef start, const char *path, Inode *out) {
        // every directory entered on the way, so ".." can go back without parent lookups
        klib::Vector<InodeRef> walk;
        walk.push_back(start);

        if (auto err = decode_inode(cache, superblock, start, out); err != Error::NONE)
            return err;

        const char *component = path;
        while (*component != '\0') {
            const char *end = component;
            while (*end != '\0' && *end != '/')
                end++;
            usize length = end - component;

            if (length == 0 || (length == 1 && component[0] == '.')) {
                // nothing to do
            } else if (!out->is_directory()) {
                return Error::NOT_A_DIRECTORY;
            } else if (length == 2 && component[0] == '.' && component[1] == '.') {
                if (walk.size() > 1) {
                    walk.pop_back();
                    if (auto err = decode_inode(cache, superblock, walk.back(), out); err != Error::NONE)
                        return err;
                }
            } else {
                Inode next;
                if (auto err = lookup(cache, superblock, *out, component, length, &next); err != Error::NONE)
                    return err;
                walk.push_back(next.ref);
                *out = klib::move(next);
            }

            component = *end == '/' ? end + 1 : end;
        }
        return Error::NONE;
    }

    Error list(MetadataCache *cache, const Superblock &superblock, const Inode &dir, klib::Vector<DirectoryEntry> *out) {
        out->clear();
        return for_each_entry(cache, superblock, dir, [&](const DirectoryEntry &entry) {
            out->push_back(entry);
            return true;
        });
    }
}
