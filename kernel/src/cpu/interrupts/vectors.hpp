#pragma once

#include <klib/common.hpp>

// Vectors for which the cpu pushes an error code before entering the handler:
// double fault, invalid TSS, segment not present, stack-segment fault,
// general protection fault, page fault, alignment check.
// The stub generator in cpu/entry.cpp expands this same list, a vector missing
// here gets a stub that misaligns every frame it builds.
#define IDT_ERROR_CODE_VECTORS(X) X(8) X(10) X(11) X(12) X(13) X(14) X(17)

namespace cpu::interrupts {
    constexpr usize vector_count = 256;
    constexpr usize exception_count = 32;

    enum Exception : u8 {
        DIVIDE_ERROR = 0,
        DEBUG = 1,
        NMI = 2,
        BREAKPOINT = 3,
        DOUBLE_FAULT = 8,
        GENERAL_PROTECTION = 13,
        PAGE_FAULT = 14
    };

#define IDT_ERROR_CODE_ENTRY(vec) vec,
    constexpr u8 error_code_vectors[] = { IDT_ERROR_CODE_VECTORS(IDT_ERROR_CODE_ENTRY) };
#undef IDT_ERROR_CODE_ENTRY

    constexpr bool has_error_code(usize vec) {
        for (u8 v : error_code_vectors)
            if (v == vec)
                return true;
        return false;
    }

    static_assert(has_error_code(DOUBLE_FAULT) && has_error_code(GENERAL_PROTECTION) && has_error_code(PAGE_FAULT));
    static_assert(!has_error_code(DIVIDE_ERROR) && !has_error_code(BREAKPOINT) && !has_error_code(vector_count - 1));

    const char* exception_name(usize vec);
}
