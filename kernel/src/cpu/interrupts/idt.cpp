#include <cpu/interrupts/idt.hpp>
#include <cpu/gdt/gdt.hpp>
#include <cpu/cpu.hpp>
#include <klib/cstdio.hpp>
#include <klib/bitmap.hpp>
#include <panic.hpp>

namespace cpu::interrupts {
    [[gnu::aligned(16)]] static IDTEntry idt[vector_count];
    static IDTR idtr;
    static ISR isr_table[vector_count];
    static klib::Bitmap<vector_count> idt_bitmap;
    static bool idt_built = false;

    u8 allocate_vector() {
        usize vec = idt_bitmap.find_clear(exception_count);
        if (vec == idt_bitmap.npos)
            panic("Failed to allocate interrupt");
        idt_bitmap.set(vec, true);
        return vec;
    }

    void free_vector(u8 vec) {
        ASSERT(vec >= exception_count);
        ASSERT(idt_bitmap.get(vec));
        idt_bitmap.set(vec, false);
        set_isr(vec, nullptr, nullptr);
    }

    IDTEntry make_idt_entry(void (*wrapper)(), IDTType type, u8 ist) {
        IDTEntry entry;
        entry.offset1 = (u64)wrapper & 0xFFFF;
        entry.offset2 = ((u64)wrapper & 0xFFFF0000) >> 16;
        entry.offset3 = ((u64)wrapper & 0xFFFFFFFF00000000) >> 32;
        entry.selector = u16(GDTSegment::KERNEL_CODE_64);
        entry.attributes = (1 << 15) | (int(type) << 8) | (ist & 7); // present, type, IST slot
        entry.reserved = 0;
        return entry;
    }

    void set_isr(u8 vec, ISR::Handler handler, void *priv) {
        isr_table[vec].handler = handler;
        isr_table[vec].priv = priv;
    }

    static const char *exception_strings[exception_count] = {
        "Division by 0",
        "Debug",
        "NMI",
        "Breakpoint",
        "Overflow",
        "Bound range exceeded",
        "Invalid opcode",
        "Device not available",
        "Double fault",
        "Coprocessor segment overrun",
        "Invalid TSS",
        "Segment not present",
        "Stack-segment fault",
        "General protection fault",
        "Page fault",
        "???",
        "x87 exception",
        "Alignment check",
        "Machine check",
        "SIMD exception",
        "Virtualisation",
        "Control protection",
        "???",
        "???",
        "???",
        "???",
        "???",
        "???",
        "Hypervisor injection",
        "VMM communication",
        "Security",
        "???"
    };

    const char* exception_name(usize vec) {
        return vec < exception_count ? exception_strings[vec] : "Not an exception";
    }

    [[noreturn]] static void exception_handler(void *, TrapFrame *frame) {
        u64 vec = frame->vector;
        klib::printf("\nCPU Exception: %s (%#lX) in %s mode\n", exception_name(vec), vec, frame->from_user() ? "user" : "kernel");
        if (has_error_code(vec)) klib::printf("Error code: %#04lX\n", frame->err);
        if (vec == PAGE_FAULT) klib::printf("CR2=%016lX\n", cpu::read_cr2());
        klib::printf("RAX=%016lX RBX=%016lX RCX=%016lX RDX=%016lX\n", frame->rax, frame->rbx, frame->rcx, frame->rdx);
        klib::printf("RSI=%016lX RDI=%016lX RBP=%016lX RSP=%016lX\n", frame->rsi, frame->rdi, frame->rbp, frame->rsp);
        klib::printf(" R8=%016lX  R9=%016lX R10=%016lX R11=%016lX\n", frame->r8,  frame->r9,  frame->r10, frame->r11);
        klib::printf("R12=%016lX R13=%016lX R14=%016lX R15=%016lX\n", frame->r12, frame->r13, frame->r14, frame->r15);
        klib::printf("RIP=%016lX RFLAGS=%016lX\n", frame->rip, frame->rflags);
        klib::printf("CS=%04lX SS=%04lX\n", frame->cs, frame->ss);
        klib::printf("\nStacktrace:\n");
        // a user frame pointer means nothing to the kernel
        StackFrame *stack_frame = frame->from_user() ? nullptr : (StackFrame*)frame->rbp;
        while (true) {
            if (stack_frame == nullptr || stack_frame->ip == 0)
                break;

            klib::printf("%#lX\n", stack_frame->ip);
            stack_frame = stack_frame->next;
        }
        panic("Cannot recover from CPU exception %#lX", vec);
    }

    extern "C" void interrupt_handler(TrapFrame *frame) {
        u64 vec = frame->vector;
        ISR *isr = &isr_table[vec];
        if (isr->handler) [[likely]] {
            isr->handler(isr->priv, frame);
            return;
        }

        if (vec < exception_count)
            exception_handler(nullptr, frame);

        klib::printf("IDT: spurious interrupt on vector %lu (rip %#lX)\n", vec, frame->rip);
    }

    // builds the table on the first call, every later call only loads it on the calling core
    void load_idt() {
        if (!idt_built) {
            for (usize i = 0; i < vector_count; i++)
                idt[i] = make_idt_entry(__idt_wrappers[i], IDTType::INTERRUPT, vector_ist(i));

            for (usize i = 0; i < exception_count; i++) {
                set_isr(i, exception_handler, nullptr);
                idt_bitmap.set(i, true);
            }

            idtr.limit = sizeof(idt) - 1;
            idtr.base = (u64)&idt;
            idt_built = true;
            klib::printf("IDT: %lu gates, double fault on IST%d, NMI on IST%d\n", vector_count, double_fault_ist, nmi_ist);
        }

        asm volatile("lidt %0" : : "m" (idtr));
    }
}
