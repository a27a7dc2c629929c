#include <cpu/gdt/gdt.hpp>

namespace cpu {
    // null, 4 flat segments, and a 16 byte TSS descriptor per core
    [[gnu::aligned(8)]] static GDTEntry gdt[5 + 2 * max_cpus];

    static void flush_gdt(GDTR *gdtr) {
        asm volatile(
            "lgdt (%0)\n"
            "mov %1, %%ds\n"
            "mov %1, %%es\n"
            "mov %1, %%ss\n"
            "xor %%eax, %%eax\n"
            "mov %%eax, %%fs\n"
            "mov %%eax, %%gs\n"
            "pushq %2\n"
            "lea 1f(%%rip), %%rax\n"
            "pushq %%rax\n"
            "lretq\n"
            "1:\n"
            : : "r" (gdtr), "r" (u64(GDTSegment::KERNEL_DATA_64)), "i" (u64(GDTSegment::KERNEL_CODE_64))
            : "rax", "memory");
    }

    static usize tss_slot = 5;

    void load_gdt() {
        // the first core fills the table, the others only load it
        if (gdt[1].access == 0) {
            gdt[0] = { 0 };

            // 64-bit kernel code
            gdt[1] = {
                .limit = 0,
                .base_low = 0,
                .base_mid = 0,
                .access = 0b10011010,
                .granularity = 0b00100000,
                .base_high = 0
            };

            // 64-bit kernel data
            gdt[2] = {
                .limit = 0,
                .base_low = 0,
                .base_mid = 0,
                .access = 0b10010010,
                .granularity = 0,
                .base_high = 0
            };

            // 64-bit user data
            gdt[3] = {
                .limit = 0,
                .base_low = 0,
                .base_mid = 0,
                .access = 0b11110010,
                .granularity = 0,
                .base_high = 0
            };

            // 64-bit user code
            gdt[4] = {
                .limit = 0,
                .base_low = 0,
                .base_mid = 0,
                .access = 0b11111010,
                .granularity = 0b00100000,
                .base_high = 0
            };
        }

        GDTR gdtr;
        gdtr.limit = sizeof(gdt) - 1;
        gdtr.base = u64(&gdt);
        flush_gdt(&gdtr);
    }

    void load_tss(TSS *tss) {
        usize slot = __atomic_fetch_add(&tss_slot, 2, __ATOMIC_SEQ_CST);
        if (slot + 1 >= sizeof(gdt) / sizeof(GDTEntry))
            panic("GDT: no descriptor slot left for TSS");

        uptr tss_addr = uptr(tss);
        tss->io_map_base = sizeof(TSS);

        gdt[slot] = {
            .limit = sizeof(TSS) - 1,
            .base_low = u16(tss_addr),
            .base_mid = u8(tss_addr >> 16),
            .access = 0b10001001,
            .granularity = 0b00000000,
            .base_high = u8(tss_addr >> 24)
        };

        gdt[slot + 1] = {
            .limit = u16(tss_addr >> 32),
            .base_low = u16(tss_addr >> 48)
        };

        asm volatile("ltr %0" : : "r" (u16(slot * sizeof(GDTEntry))) : "memory");
    }
}
