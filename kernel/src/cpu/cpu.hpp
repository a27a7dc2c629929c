#pragma once

#include <klib/common.hpp>
#include <panic.hpp>

struct limine_mp_response;
struct limine_mp_info;

namespace cpu {
    constexpr usize max_cpus = 64;

    void early_init();
    void smp_init(limine_mp_response *smp_res);
    void init(limine_mp_info *info);
    u32 online_cores();

    struct [[gnu::packed]] TSS {
        u32 reserved0;
        u64 rsp0, rsp1, rsp2;
        u64 reserved1;
        u64 ist1, ist2, ist3, ist4, ist5, ist6, ist7;
        u64 reserved2;
        u16 reserved3;
        u16 io_map_base;
    };

    // per-core state, one per logical processor, never shared between cores
    struct CPU {
        uptr syscall_stack = 0; // loaded into IA32_SYSENTER_ESP, found again by __syscall_entry
        TSS tss = {};
    };

    namespace MSR {
        enum R : u32 {
            IA32_SYSENTER_ESP = 0x175,
            IA32_EFER = 0xC0000080,
            IA32_STAR = 0xC0000081,
            IA32_LSTAR = 0xC0000082,
            IA32_FMASK = 0xC0000084
        };

        // rdmsr/wrmsr split the value across edx:eax
        static inline constexpr u64 compose(u32 hi, u32 lo) {
            return ((u64)hi << 32) | lo;
        }

        static inline u64 read(R msr) {
            volatile u32 lo, hi;
            asm volatile("rdmsr" : "=a" (lo), "=d" (hi) : "c" (msr));
            return compose(hi, lo);
        }

        static inline void write(R msr, u64 val) {
            volatile u32 lo = val & 0xFFFFFFFF;
            volatile u32 hi = val >> 32;
            asm volatile("wrmsr" : : "a" (lo), "d" (hi), "c" (msr));
        }
    };

    namespace RFLAGS {
        enum : u64 {
            TF = 1 << 8,
            IF = 1 << 9,
            DF = 1 << 10
        };
    }

    namespace EFER {
        enum : u64 {
            SCE = 1 << 0
        };
    }

    static inline u64 read_cr2() {
        volatile u64 cr2;
        asm volatile("mov %%cr2, %0" : "=r" (cr2));
        return cr2;
    }

    static inline bool get_interrupt_state() {
        u64 interrupt_state;
        asm volatile("pushfq; pop %0" : "=r" (interrupt_state) : : "memory");
        return (interrupt_state & RFLAGS::IF) != 0;
    }

    static inline void toggle_interrupts(bool state) {
        if (state)
            asm volatile("sti");
        else
            asm volatile("cli");
    }

    template<klib::Integral T> static inline void out(const u16 port, const T val) {
        panic("cpu::out must be used with u8");
    }

    template<>
    inline void out<u8>(const u16 port, const u8 val) {
        asm volatile("outb %0, %1" : : "a" (val), "Nd" (port));
    }

    template<klib::Integral T> static inline T in(const u16 port) {
        panic("cpu::in must be used with u8");
    }

    template<>
    inline u8 in<u8>(const u16 port) {
        volatile u8 ret;
        asm volatile("inb %1, %0" : "=a" (ret) : "Nd" (port));
        return ret;
    }
}
