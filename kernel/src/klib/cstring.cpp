#include <klib/cstring.hpp>

namespace klib {
    usize strlen(const char *str) {
        usize len = 0;
        while (str[len])
            len++;
        return len;
    }

    usize strnlen(const char *str, usize maxlen) {
        usize len = 0;
        for (; len < maxlen && str[len] != '\0'; len++);
        return len;
    }

    int strcmp(const char *lhs, const char *rhs) {
        while (*lhs && (*lhs == *rhs)) {
            lhs++;
            rhs++;
        }
        return *(const unsigned char*)lhs - *(const unsigned char*)rhs;
    }

    int strncmp(const char *lhs, const char *rhs, usize count) {
        while (count && *lhs && (*lhs == *rhs)) {
            lhs++;
            rhs++;
            count--;
        }
        return count ? (*(const unsigned char*)lhs - *(const unsigned char*)rhs) : 0;
    }

    const char* strchr(const char *str, char c) {
        while (*str != c)
            if (*str++ == 0)
                return nullptr;
        return str;
    }

    // copies at most size - 1 bytes and always terminates, returns strlen(src)
    usize strlcpy(char *dst, const char *src, usize size) {
        usize len = strlen(src);
        if (size) {
            usize n = len < size - 1 ? len : size - 1;
            memcpy(dst, src, n);
            dst[n] = '\0';
        }
        return len;
    }

    bool ends_with(const char *str, const char *suffix) {
        usize len = strlen(str), suffix_len = strlen(suffix);
        return suffix_len <= len && memcmp(str + len - suffix_len, suffix, suffix_len) == 0;
    }
}
