#pragma once

#include <klib/common.hpp>

// the kernel heap; everything the drivers allocate goes through these
namespace klib {
    void* malloc(usize size);
    void* calloc(usize size);
    void* realloc(void *ptr, usize size);
    void free(void *ptr);
}
