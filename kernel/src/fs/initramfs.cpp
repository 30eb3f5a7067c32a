#include <fs/initramfs.hpp>
#include <klib/cstdio.hpp>
#include <klib/cstring.hpp>

namespace initramfs {
    static squashfs::MemoryBlockSource *source = nullptr;
    static squashfs::Archive *mounted = nullptr;

    static bool parse_decimal(const char *str, usize len, usize *out) {
        if (len == 0)
            return false;
        usize value = 0;
        for (usize i = 0; i < len; i++) {
            if (str[i] < '0' || str[i] > '9')
                return false;
            usize digit = str[i] - '0';
            if (value > (klib::NumericLimits<usize>::max - digit) / 10)
                return false;
            value = value * 10 + digit;
        }
        *out = value;
        return true;
    }

    // copies a value into a fixed buffer, values that do not fit keep the default
    static void copy_value(char *dst, usize size, const char *value, usize len) {
        if (len == 0 || len >= size)
            return;
        memcpy(dst, value, len);
        dst[len] = '\0';
    }

    static bool key_is(const char *token, usize key_len, const char *key) {
        return klib::strlen(key) == key_len && klib::strncmp(token, key, key_len) == 0;
    }

    Options parse_cmdline(const char *cmdline) {
        Options options;
        if (cmdline == nullptr)
            return options;

        const char *token = cmdline;
        while (*token) {
            while (*token == ' ')
                token++;
            const char *end = token;
            while (*end && *end != ' ')
                end++;

            const char *equals = token;
            while (equals < end && *equals != '=')
                equals++;

            if (equals < end) {
                usize key_len = equals - token;
                const char *value = equals + 1;
                usize value_len = end - value;

                if (key_is(token, key_len, "initramfs")) {
                    copy_value(options.module, sizeof(options.module), value, value_len);
                } else if (key_is(token, key_len, "init")) {
                    copy_value(options.init, sizeof(options.init), value, value_len);
                } else if (key_is(token, key_len, "initramfs.cache")) {
                    usize blocks;
                    if (parse_decimal(value, value_len, &blocks) && blocks > 0)
                        options.mount.metadata_cache_blocks = blocks;
                }
            }

            token = end;
        }
        return options;
    }

    squashfs::Error mount(const void *addr, usize size, const Options &options) {
        unmount();

        source = new squashfs::MemoryBlockSource(addr, size);
        if (auto err = squashfs::Archive::mount(source, options.mount, &mounted); err != squashfs::Error::NONE) {
            klib::printf("initramfs: failed to mount %s: %s\n", options.module, squashfs::error_string(err));
            delete source;
            source = nullptr;
            mounted = nullptr;
            return err;
        }
        return squashfs::Error::NONE;
    }

    void unmount() {
        delete mounted;
        mounted = nullptr;
        delete source;
        source = nullptr;
    }

    squashfs::Archive* archive() {
        return mounted;
    }

    squashfs::Error load_file(const char *path, klib::Vector<u8> *out) {
        if (mounted == nullptr)
            return squashfs::Error::NOT_FOUND;

        squashfs::FileHandle *handle;
        if (auto err = mounted->open(path, &handle); err != squashfs::Error::NONE)
            return err;
        defer { mounted->close(handle); };

        if (!out->resize(handle->inode.size))
            return squashfs::Error::NO_MEMORY;
        return mounted->read(handle, 0, handle->inode.size, out->data());
    }
}
