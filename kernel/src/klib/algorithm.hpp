#pragma once

#include <klib/common.hpp>

namespace klib {
    template<Integral A, Integral B>
    inline constexpr auto min(const A a, const B b) {
        return (b < a) ? b : a;
    }

    template<Integral A, Integral B>
    inline constexpr auto max(const A a, const B b) {
        return (a < b) ? b : a;
    }

    template<Integral V, Integral L, Integral H>
    inline constexpr auto clamp(const V v, const L low, const H high) {
        return min(max(v, low), high);
    }

    template<Integral T>
    inline constexpr const T align_up(const T i, usize alignment) {
        return i % alignment ? ((i / alignment) + 1) * alignment : i;
    }

    template<Integral T>
    inline constexpr T div_round_up(const T x, const T divisor) {
        return (x + divisor - 1) / divisor;
    }

    template<Integral T>
    inline constexpr bool is_power_of_two(const T x) {
        return x != 0 && (x & (x - 1)) == 0;
    }

    inline constexpr usize num_digits(u64 x, u64 base = 10) {
        usize i = 0;
        while (x /= base) i++;
        return i;
    }

    // true if a + b would not fit in a u64
    inline constexpr bool add_overflows(u64 a, u64 b) {
        return a + b < a;
    }
}
