#pragma once

#include <klib/vector.hpp>
#include <fs/squashfs/archive.hpp>

// the boot archive handed over by the boot loader as a module, mounted read-only for the life of the kernel
namespace initramfs {
    constexpr usize max_module_path = 128;
    constexpr usize max_init_path = 256;

    struct Options {
        char module[max_module_path] = "initramfs.img"; // matched against the end of the module path
        char init[max_init_path] = "/sbin/init";
        squashfs::MountOptions mount;
    };

    // understands initramfs=<suffix>, initramfs.cache=<blocks> and init=<path>, everything else is ignored
    Options parse_cmdline(const char *cmdline);

    squashfs::Error mount(const void *addr, usize size, const Options &options);
    void unmount();

    // nullptr until mount succeeded
    squashfs::Archive* archive();

    // reads the whole file at path into out
    squashfs::Error load_file(const char *path, klib::Vector<u8> *out);
}
