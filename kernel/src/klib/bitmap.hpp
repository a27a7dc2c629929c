#pragma once

#include <klib/common.hpp>
#include <klib/algorithm.hpp>

namespace klib {
    template<usize size>
    struct Bitmap {
        static constexpr usize bits_per_usize = sizeof(usize) * 8;
        static constexpr usize npos = size;

        usize data[bits_to<usize>(size)] = {};

        constexpr Bitmap() {}

        inline bool get(usize index) const {
            return (data[index / bits_per_usize] >> (index % bits_per_usize)) & 1;
        }

        inline void set(usize index, bool value) {
            usize d = index / bits_per_usize;
            usize r = index % bits_per_usize;
            if (value)
                data[d] |= (usize)1 << r;
            else
                data[d] &= ~((usize)1 << r);
        }

        // returns npos if every bit from start onwards is set
        usize find_clear(usize start = 0) const {
            for (usize i = start; i < size; i++) {
                usize word = data[i / bits_per_usize];
                if (word == ~(usize)0) {
                    i = align_up(i + 1, bits_per_usize) - 1;
                    continue;
                }
                if (((word >> (i % bits_per_usize)) & 1) == 0)
                    return i;
            }
            return npos;
        }
    };
}
