#include <klib/cstdlib.hpp>
#include <klib/cstring.hpp>
#include <mem/bump.hpp>

namespace klib {
    void* malloc(usize size) {
        return mem::bump::allocate(size);
    }

    void* calloc(usize size) {
        auto ptr = mem::bump::allocate(size);
        if (ptr)
            memset(ptr, 0, size);
        return ptr;
    }

    void* realloc(void *ptr, usize size) {
        return mem::bump::reallocate(ptr, size);
    }

    void free(void *ptr) {
        mem::bump::free(ptr);
    }

    extern "C" int atexit(void (*)()) {
        return 0;
    }
}
