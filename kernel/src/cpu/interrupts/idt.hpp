#pragma once

#include <klib/common.hpp>
#include <cpu/interrupts/frame.hpp>
#include <cpu/interrupts/vectors.hpp>

// one entry stub per vector, generated in cpu/entry.cpp
extern "C" void (*__idt_wrappers[cpu::interrupts::vector_count])();

namespace cpu::interrupts {
    struct [[gnu::packed]] IDTR {
        u16 limit;
        u64 base;
    };

    enum class IDTType {
        INTERRUPT = 0b1110,
        TRAP = 0b1111
    };

    struct [[gnu::packed]] IDTEntry {
        u16 offset1;
        u16 selector;
        u16 attributes;
        u16 offset2;
        u32 offset3;
        u32 reserved;
    };

    static_assert(sizeof(IDTEntry) == 16);

    // interrupt stack table slots, see cpu::early_init
    constexpr u8 double_fault_ist = 1;
    constexpr u8 nmi_ist = 2;

    constexpr u8 vector_ist(usize vec) {
        if (vec == DOUBLE_FAULT)
            return double_fault_ist;
        if (vec == NMI)
            return nmi_ist;
        return 0;
    }

    struct ISR {
        using Handler = void (*)(void *priv, TrapFrame *frame);

        Handler handler;
        void *priv;
    };

    // present, DPL 0, kernel code selector
    IDTEntry make_idt_entry(void (*wrapper)(), IDTType type, u8 ist);

    u8 allocate_vector();
    void free_vector(u8 vec);
    void set_isr(u8 vec, ISR::Handler handler, void *priv);
    void load_idt();
}
