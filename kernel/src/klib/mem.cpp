#include <klib/common.hpp>

// freestanding builds only, hosted builds get these from the C library
extern "C" {
    void* memcpy(void *dst, const void *src, usize size) {
        void *ret = dst;
        asm volatile("rep movsb" : "+D" (dst), "+S" (src), "+c" (size) : : "memory");
        return ret;
    }

    void* memset(void *dst, int value, usize size) {
        void *ret = dst;
        asm volatile("rep stosb" : "+D" (dst), "+c" (size) : "a" ((u8)value) : "memory");
        return ret;
    }

    void* memmove(void *dst, const void *src, usize size) {
        if ((uptr)dst <= (uptr)src || (uptr)dst >= (uptr)src + size)
            return memcpy(dst, src, size);

        void *ret = dst;
        dst = (u8*)dst + size - 1;
        src = (const u8*)src + size - 1;
        asm volatile("std; rep movsb; cld" : "+D" (dst), "+S" (src), "+c" (size) : : "memory");
        return ret;
    }

    int memcmp(const void *lhs, const void *rhs, usize size) {
        const u8 *a = (const u8*)lhs, *b = (const u8*)rhs;
        for (usize i = 0; i < size; i++)
            if (a[i] != b[i])
                return a[i] - b[i];
        return 0;
    }
}
