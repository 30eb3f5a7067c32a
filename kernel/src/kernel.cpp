#include <klib/common.hpp>
#include <klib/cstring.hpp>
#include <klib/cstdio.hpp>
#include <klib/vector.hpp>
#include <limine.h>
#include <cpu/cpu.hpp>
#include <dev/serial.hpp>
#include <mem/bump.hpp>
#include <fs/initramfs.hpp>
#include <panic.hpp>

[[gnu::used, gnu::section(".limine_requests")]]
static volatile LIMINE_BASE_REVISION(2);

[[gnu::used, gnu::section(".limine_requests")]]
static volatile limine_kernel_file_request kernel_file_req = {
    .id = LIMINE_KERNEL_FILE_REQUEST,
    .revision = 0
};

[[gnu::used, gnu::section(".limine_requests")]]
static volatile limine_module_request module_req = {
    .id = LIMINE_MODULE_REQUEST,
    .revision = 0
};

[[gnu::used, gnu::section(".limine_requests_start")]]
static volatile LIMINE_REQUESTS_START_MARKER;

[[gnu::used, gnu::section(".limine_requests_end")]]
static volatile LIMINE_REQUESTS_END_MARKER;

extern "C" void (*__init_array_start[])();
extern "C" void (*__init_array_end[])();

// the only heap the kernel has, sized for the metadata cache, scratch buffers and the init image
constexpr usize heap_size = 32 * 1024 * 1024;
alignas(16) static u8 heap_arena[heap_size];

struct StackFrame {
    StackFrame *next;
    uptr ip;
};

[[noreturn]] void panic(const char *format, ...) {
    klib::printf("\nKernel Panic: ");
    va_list list;
    va_start(list, format);
    klib::vprintf(format, list);
    va_end(list);
    StackFrame *frame = (StackFrame*)__builtin_frame_address(0);
    klib::printf("\nStacktrace:\n");
    while (true) {
        if (frame == nullptr || frame->ip == 0)
            break;

        klib::printf("%#lX\n", frame->ip);
        frame = frame->next;
    }
    cpu::halt_forever();
}

static limine_file* find_module(const char *suffix) {
    auto *response = module_req.response;
    if (response == nullptr || response->module_count == 0)
        panic("No initramfs Limine module loaded");

    for (u64 i = 0; i < response->module_count; i++)
        if (klib::ends_with(response->modules[i]->path, suffix))
            return response->modules[i];
    panic("No Limine module path ends with %s", suffix);
}

static char kind_char(squashfs::InodeKind kind) {
    switch (kind) {
    case squashfs::InodeKind::DIRECTORY: return 'd';
    case squashfs::InodeKind::SYMLINK: return 'l';
    case squashfs::InodeKind::REGULAR: return '-';
    default: return '?';
    }
}

static void list_root() {
    klib::Vector<squashfs::DirectoryEntry> entries;
    if (auto err = initramfs::archive()->list("/", &entries); err != squashfs::Error::NONE) {
        klib::printf("initramfs: cannot list /: %s\n", squashfs::error_string(err));
        return;
    }
    for (auto &entry : entries)
        klib::printf("  %c %s\n", kind_char(entry.kind), entry.name);
}

extern "C" [[noreturn]] void kmain() {
    serial::init();
    klib::printf("ReefOS\n");

    mem::bump::init((uptr)heap_arena, heap_size);
    klib::printf("Allocator: Initialized (%ld KiB)\n", heap_size / 1024);

    // call global constructors
    for (auto ctor = __init_array_start; ctor < __init_array_end; ctor++)
        (*ctor)();

    if (!LIMINE_BASE_REVISION_SUPPORTED)
        panic("Limine base revision 2 is not supported by the boot loader");

    const char *cmdline = "";
    if (kernel_file_req.response && kernel_file_req.response->kernel_file->cmdline)
        cmdline = kernel_file_req.response->kernel_file->cmdline;
    auto options = initramfs::parse_cmdline(cmdline);

    auto *module = find_module(options.module);
    klib::printf("Loading initramfs file %s (size: %ld KiB)\n", module->path, module->size / 1024);
    if (auto err = initramfs::mount(module->address, module->size, options); err != squashfs::Error::NONE)
        panic("Cannot mount initramfs: %s", squashfs::error_string(err));

    list_root();

    klib::Vector<u8> init_image;
    if (auto err = initramfs::load_file(options.init, &init_image); err != squashfs::Error::NONE)
        klib::printf("initramfs: cannot load %s: %s\n", options.init, squashfs::error_string(err));
    else
        klib::printf("initramfs: loaded %s (%ld bytes)\n", options.init, init_image.size());

    auto &stats = initramfs::archive()->metadata_cache().statistics();
    klib::printf("squashfs: metadata cache %ld hits, %ld misses, %ld evictions\n", stats.hits, stats.misses, stats.evictions);
    klib::printf("Heap: %ld KiB used\n", mem::bump::bytes_used() / 1024);

    klib::printf("Nothing left to do, halting\n");
    cpu::halt_forever();
}
