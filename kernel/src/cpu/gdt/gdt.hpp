#pragma once

#include <cpu/cpu.hpp>

// user selectors with RPL 3, as sysret loads them and as the syscall entry
// writes them into the frame it synthesises
#define GDT_USER_DATA_RPL3 0x1B
#define GDT_USER_CODE_RPL3 0x23

namespace cpu {
    struct [[gnu::packed]] GDTR {
        u16 limit;
        u64 base;
    };

    struct [[gnu::packed]] GDTEntry {
        u16 limit;
        u16 base_low;
        u8 base_mid;
        u8 access;
        u8 granularity;
        u8 base_high;
    };

    // sysret requires USER_DATA_64 directly below USER_CODE_64
    enum class GDTSegment {
        KERNEL_CODE_64 = 0x8,
        KERNEL_DATA_64 = 0x10,
        USER_DATA_64 = 0x18,
        USER_CODE_64 = 0x20,
        TSS = 0x28
    };

    static_assert((u64(GDTSegment::USER_DATA_64) | 3) == GDT_USER_DATA_RPL3);
    static_assert((u64(GDTSegment::USER_CODE_64) | 3) == GDT_USER_CODE_RPL3);
    static_assert(u64(GDTSegment::USER_CODE_64) - u64(GDTSegment::USER_DATA_64) == 8);

    void load_gdt();
    void load_tss(TSS *tss);
}
