#pragma once

#include <klib/common.hpp>

// Byte offsets of every TrapFrame field from the frame base, shared with the
// entry assembly in cpu/entry.cpp
#define TRAP_FRAME_VECTOR 0x00
#define TRAP_FRAME_ERR    0x08
#define TRAP_FRAME_R15    0x10
#define TRAP_FRAME_R14    0x18
#define TRAP_FRAME_R13    0x20
#define TRAP_FRAME_R12    0x28
#define TRAP_FRAME_R11    0x30
#define TRAP_FRAME_R10    0x38
#define TRAP_FRAME_R9     0x40
#define TRAP_FRAME_R8     0x48
#define TRAP_FRAME_RBP    0x50
#define TRAP_FRAME_RDI    0x58
#define TRAP_FRAME_RSI    0x60
#define TRAP_FRAME_RDX    0x68
#define TRAP_FRAME_RCX    0x70
#define TRAP_FRAME_RBX    0x78
#define TRAP_FRAME_RAX    0x80
#define TRAP_FRAME_RIP    0x88
#define TRAP_FRAME_CS     0x90
#define TRAP_FRAME_RFLAGS 0x98
#define TRAP_FRAME_RSP    0xA0
#define TRAP_FRAME_SS     0xA8
#define TRAP_FRAME_SIZE   0xB0

// size of the general purpose register block between err and rip
#define TRAP_FRAME_GPR_SIZE (TRAP_FRAME_RIP - TRAP_FRAME_R15)

namespace cpu {
    /*
     * Execution state of one trap, built on the stack of the interrupted context
     * by either entry path and handed to interrupt_handler / syscall_handler.
     * Fields are listed lowest address first. Whatever a handler writes into the
     * general purpose registers or the hardware part is what the CPU resumes with.
     */
    struct [[gnu::packed]] TrapFrame {
        u64 vector; // 0 on the syscall path
        u64 err; // pushed by the cpu for some exceptions, 0 otherwise
        u64 r15, r14, r13, r12, r11, r10, r9, r8;
        u64 rbp, rdi, rsi, rdx, rcx, rbx, rax;
        u64 rip, cs, rflags, rsp, ss; // pushed by the cpu, synthesised on the syscall path

        bool from_user() const { return (cs & 3) == 3; }
    };

    static constexpr usize trap_frame_gprs = 15;
    static constexpr usize trap_frame_hw_fields = 5;

    static_assert(sizeof(TrapFrame) == TRAP_FRAME_SIZE);
    static_assert(sizeof(TrapFrame) == (2 + trap_frame_gprs + trap_frame_hw_fields) * sizeof(u64));
    static_assert(TRAP_FRAME_SIZE % 16 == 0, "frame base must keep the stack 16 byte aligned");
    static_assert(TRAP_FRAME_GPR_SIZE == trap_frame_gprs * sizeof(u64));

    static_assert(offsetof(TrapFrame, vector) == TRAP_FRAME_VECTOR);
    static_assert(offsetof(TrapFrame, err) == TRAP_FRAME_ERR);
    static_assert(offsetof(TrapFrame, r15) == TRAP_FRAME_R15);
    static_assert(offsetof(TrapFrame, r14) == TRAP_FRAME_R14);
    static_assert(offsetof(TrapFrame, r13) == TRAP_FRAME_R13);
    static_assert(offsetof(TrapFrame, r12) == TRAP_FRAME_R12);
    static_assert(offsetof(TrapFrame, r11) == TRAP_FRAME_R11);
    static_assert(offsetof(TrapFrame, r10) == TRAP_FRAME_R10);
    static_assert(offsetof(TrapFrame, r9) == TRAP_FRAME_R9);
    static_assert(offsetof(TrapFrame, r8) == TRAP_FRAME_R8);
    static_assert(offsetof(TrapFrame, rbp) == TRAP_FRAME_RBP);
    static_assert(offsetof(TrapFrame, rdi) == TRAP_FRAME_RDI);
    static_assert(offsetof(TrapFrame, rsi) == TRAP_FRAME_RSI);
    static_assert(offsetof(TrapFrame, rdx) == TRAP_FRAME_RDX);
    static_assert(offsetof(TrapFrame, rcx) == TRAP_FRAME_RCX);
    static_assert(offsetof(TrapFrame, rbx) == TRAP_FRAME_RBX);
    static_assert(offsetof(TrapFrame, rax) == TRAP_FRAME_RAX);
    static_assert(offsetof(TrapFrame, rip) == TRAP_FRAME_RIP);
    static_assert(offsetof(TrapFrame, cs) == TRAP_FRAME_CS);
    static_assert(offsetof(TrapFrame, rflags) == TRAP_FRAME_RFLAGS);
    static_assert(offsetof(TrapFrame, rsp) == TRAP_FRAME_RSP);
    static_assert(offsetof(TrapFrame, ss) == TRAP_FRAME_SS);
}

extern "C" void interrupt_handler(cpu::TrapFrame *frame);
extern "C" void syscall_handler(cpu::TrapFrame *frame);
