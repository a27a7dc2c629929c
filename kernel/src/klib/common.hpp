#pragma once

#include <stdint.h>
#include <stddef.h>

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using usize = size_t;
using isize = i64;
using uptr = uintptr_t;

namespace klib {
    template<typename T, T v>
    struct IntegralConstant {
        static constexpr T value = v;
    };

    template<bool v>
    using BooleanConstant = IntegralConstant<bool, v>;

    using True = BooleanConstant<true>;
    using False = BooleanConstant<false>;

    template<typename> struct IsIntegral : public False {};
    template<> struct IsIntegral<bool> : public True {};
    template<> struct IsIntegral<u8> : public True {};
    template<> struct IsIntegral<u16> : public True {};
    template<> struct IsIntegral<u32> : public True {};
    template<> struct IsIntegral<u64> : public True {};
    template<> struct IsIntegral<i8> : public True {};
    template<> struct IsIntegral<i16> : public True {};
    template<> struct IsIntegral<i32> : public True {};
    template<> struct IsIntegral<i64> : public True {};

    template<typename T> concept Integral = IsIntegral<T>::value;
}

// saved rbp chain, walked for stack traces
struct StackFrame {
    StackFrame *next;
    uptr ip;
};

#define CONCAT(a, b) a ## b

#define STRINGIFY(x) #x
#define STRINGIFY2(x) STRINGIFY(x)

