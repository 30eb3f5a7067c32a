#include <klib/cstdio.hpp>

namespace klib {
    int vprintf(const char *format, va_list list) {
        return vprintf_template(putchar, format, list);
    }

    int printf(const char *format, ...) {
        va_list list;
        va_start(list, format);
        int i = vprintf(format, list);
        va_end(list);
        return i;
    }

    int snprintf(char *buffer, usize size, const char *format, ...) {
        va_list list;
        va_start(list, format);

        usize i = 0;
        int written = vprintf_template([&] (char c) {
            if (i + 1 < size) {
                buffer[i] = c;
                i++;
            }
        }, format, list);
        if (size > 0)
            buffer[i] = '\0';

        va_end(list);
        return written;
    }
}
