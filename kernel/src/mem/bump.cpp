#include <mem/bump.hpp>
#include <klib/cstring.hpp>
#include <klib/algorithm.hpp>

namespace mem::bump {
    // every allocation is preceded by its size so reallocate knows how much to copy
    struct alignas(default_alignment) Header {
        usize size;
    };

    static uptr alloc_base;
    static usize total_size;
    static usize alloc_ptr;

    void init(uptr base, usize size) {
        alloc_base = klib::align_up(base, default_alignment);
        total_size = size - (alloc_base - base);
        alloc_ptr = 0;
    }

    void* allocate(usize size) {
        if (size == 0)
            return nullptr;

        usize needed = sizeof(Header) + klib::align_up(size, default_alignment);
        if (needed > total_size - alloc_ptr)
            return nullptr;

        auto *header = (Header*)(alloc_base + alloc_ptr);
        header->size = size;
        alloc_ptr += needed;
        return header + 1;
    }

    void free(void *ptr) {}

    void* reallocate(void *ptr, usize size) {
        if (ptr == nullptr)
            return allocate(size);

        if (size == 0) {
            free(ptr);
            return nullptr;
        }

        auto *header = (Header*)ptr - 1;
        if (size <= header->size)
            return ptr;

        void *new_ptr = allocate(size);
        if (new_ptr == nullptr)
            return nullptr;
        memcpy(new_ptr, ptr, header->size);
        free(ptr);
        return new_ptr;
    }

    usize bytes_used() {
        return alloc_ptr;
    }
}
