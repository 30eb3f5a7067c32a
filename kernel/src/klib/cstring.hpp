#pragma once

#include <klib/common.hpp>

#if __STDC_HOSTED__
#include <string.h>
#else
// mem functions are implemented in klib/mem.cpp
extern "C" int memcmp(const void *lhs, const void *rhs, usize size);
extern "C" void* memcpy(void *dst, const void *src, usize size);
extern "C" void* memmove(void *dst, const void *src, usize size);
extern "C" void* memset(void *dst, int value, usize size);

#define memcmp __builtin_memcmp
#define memcpy __builtin_memcpy
#define memmove __builtin_memmove
#define memset __builtin_memset
#endif

namespace klib {
    usize strlen(const char *str);
    usize strnlen(const char *str, usize maxlen);
    int strcmp(const char *lhs, const char *rhs);
    int strncmp(const char *lhs, const char *rhs, usize count);
    const char* strchr(const char *str, char c);
    usize strlcpy(char *dst, const char *src, usize size);
    bool ends_with(const char *str, const char *suffix);
}
