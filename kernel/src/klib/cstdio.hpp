#pragma once

#include <stdarg.h>
#include <klib/common.hpp>
#include <klib/algorithm.hpp>

namespace klib {
    // the diagnostic sink, provided by the platform (serial port in the kernel)
    int putchar(char c);

    [[gnu::format(printf, 1, 0)]] int vprintf(const char *format, va_list list);
    [[gnu::format(printf, 1, 2)]] int printf(const char *format, ...);
    [[gnu::format(printf, 3, 4)]] int snprintf(char *buffer, usize size, const char *format, ...);

    template<typename F> concept Putchar = requires(F f) { f(' '); };

    template<Putchar Put>
    constexpr inline int print_number(Put put, u64 value, u64 base, bool upper, usize padding, bool zero_padding) {
        const char *digits_lower = "0123456789abcdef";
        const char *digits_upper = "0123456789ABCDEF";
        const char *used = upper ? digits_upper : digits_lower;

        int written = 0;
        usize digits = num_digits(value, base) + 1;
        for (usize i = digits; i < padding; i++, written++)
            put(zero_padding ? '0' : ' ');

        for (isize di = digits - 1; di >= 0; di--) {
            u64 v = value;
            for (isize dii = 0; dii < di; dii++) v /= base;
            put(used[v % base]);
            written++;
        }
        return written;
    }

    // supports %d %u %x %X %o %c %s with '#', '0', width, '*', ".*" and 'l'
    template<Putchar Put>
    [[gnu::format(printf, 2, 0)]] constexpr inline int vprintf_template(Put put, const char *format, va_list list) {
        int written = 0;
        for (int i = 0; format[i]; i++) {
            if (format[i] != '%') {
                put(format[i]);
                written++;
                continue;
            }

            bool alt_form = false;
            bool long_int = false;
            bool zero_padding = false;
            usize padding = 0;
            usize s_length = 0;
            bool has_s_length = false;

            for (i++; format[i]; i++) {
                char c = format[i];
                if (c == '#') {
                    alt_form = true;
                } else if (c == '0' && padding == 0) {
                    zero_padding = true;
                } else if (c >= '0' && c <= '9') {
                    padding = padding * 10 + (c - '0');
                } else if (c == 'l') {
                    long_int = true;
                } else if (c == '*') {
                    padding = va_arg(list, int);
                } else if (c == '.' && format[i + 1] == '*') {
                    has_s_length = true;
                    s_length = va_arg(list, int);
                    i++;
                } else {
                    break;
                }
            }

            switch (format[i]) {
            case 'd': {
                i64 value = long_int ? va_arg(list, i64) : va_arg(list, i32);
                if (value < 0) {
                    put('-');
                    written++;
                    written += print_number(put, -(u64)value, 10, false, padding ? padding - 1 : 0, zero_padding);
                } else {
                    written += print_number(put, value, 10, false, padding, zero_padding);
                }
                break;
            }
            case 'u':
            case 'o':
            case 'x':
            case 'X': {
                u64 value = long_int ? va_arg(list, u64) : va_arg(list, u32);
                u64 base = format[i] == 'u' ? 10 : (format[i] == 'o' ? 8 : 16);
                if (alt_form && base == 16) {
                    put('0');
                    put('x');
                    written += 2;
                } else if (alt_form && base == 8) {
                    put('0');
                    written++;
                }
                written += print_number(put, value, base, format[i] == 'X', padding, zero_padding);
                break;
            }
            case 'c':
                put((char)va_arg(list, int));
                written++;
                break;
            case 's': {
                const char *str = va_arg(list, const char*);
                if (str == nullptr)
                    str = "(null)";
                for (usize j = 0; has_s_length ? j < s_length : str[j] != '\0'; j++, written++)
                    put(str[j]);
                break;
            }
            case '%':
                put('%');
                written++;
                break;
            case '\0':
                return written;
            default:
                break;
            }
        }
        return written;
    }

    template<Putchar Put>
    [[gnu::format(printf, 2, 3)]] constexpr inline int printf_template(Put put, const char *format, ...) {
        va_list list;
        va_start(list, format);
        int i = vprintf_template(put, format, list);
        va_end(list);
        return i;
    }
}
