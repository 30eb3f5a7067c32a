#include <klib/cstdlib.hpp>
#include <klib/cstring.hpp>
#include <panic.hpp>

extern "C" {
    uptr __stack_chk_guard = 0xED1A449A97A8154E;
    void __stack_chk_fail() {
        panic("Stack smashing detected");
    }
}

// the kernel only runs the boot thread, so static initialisation needs no lock
using __guard = u64;
#define GUARD_INITIALIZED (1 << 0)
#define GUARD_IN_USE (1 << 1)

namespace __cxxabiv1 {
    extern "C" i32 __cxa_guard_acquire(__guard *g) {
        if (*g & GUARD_INITIALIZED)
            return 0;
        if (*g & GUARD_IN_USE)
            panic("__cxa_guard_acquire: recursive static initialisation");
        *g |= GUARD_IN_USE;
        return 1;
    }

    extern "C" void __cxa_guard_release(__guard *g) {
        *g = GUARD_INITIALIZED;
    }

    extern "C" void __cxa_guard_abort(__guard *g) {
        *g = 0;
    }
}

extern "C" void __cxa_pure_virtual() {
    panic("__cxa_pure_virtual called");
}

void* operator new(usize size) {
    void *ptr = klib::malloc(size);
    if (ptr == nullptr)
        panic("operator new: out of memory (%ld bytes)", size);
    return ptr;
}

void* operator new[](usize size) {
    return ::operator new(size);
}

void operator delete(void *ptr) {
    klib::free(ptr);
}

void operator delete[](void *ptr) {
    klib::free(ptr);
}

void operator delete(void *ptr, usize size) {
    memset(ptr, 0xAE, size);
    ::operator delete(ptr);
}

void operator delete[](void *ptr, usize) {
    ::operator delete[](ptr);
}
