#pragma once

#include <klib/common.hpp>

// early boot heap, carved out of a fixed arena and never given back
namespace mem::bump {
    constexpr usize default_alignment = 16;

    void init(uptr base, usize size);
    void* allocate(usize size);
    void* reallocate(void *ptr, usize size);
    void free(void *ptr);

    usize bytes_used();
}
