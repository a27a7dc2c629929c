#pragma once

#include <klib/common.hpp>

namespace klib {
    template<Integral T>
    inline constexpr const T align_up(const T i, usize alignment) {
        return i % alignment ? ((i / alignment) + 1) * alignment : i;
    }

    template<Integral T>
    inline constexpr const T align_down(const T i, usize alignment) {
        return i - (i % alignment);
    }

    template<Integral T>
    inline constexpr usize bits_to(usize i) {
        return align_up(i, sizeof(T) * 8) / (sizeof(T) * 8);
    }

    inline constexpr usize num_digits(u64 x, u64 base = 10) {
        usize i = 0;
        while (x /= base) i++;
        return i;
    }
}
