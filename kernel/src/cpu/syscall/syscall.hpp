#pragma once

#include <klib/common.hpp>
#include <cpu/cpu.hpp>
#include <cpu/gdt/gdt.hpp>
#include <cpu/interrupts/frame.hpp>

#ifndef TRAPGATE_SYSCALL_TRACE
#define TRAPGATE_SYSCALL_TRACE 0
#endif

#ifndef TRAPGATE_UNIMPLEMENTED_SYSCALL_TRACE
#define TRAPGATE_UNIMPLEMENTED_SYSCALL_TRACE 1
#endif

#if TRAPGATE_SYSCALL_TRACE
#include <klib/cstdio.hpp>
#define log_syscall(format, ...) cpu::syscall::log_syscall_impl(format __VA_OPT__(,) __VA_ARGS__)
#else
#define log_syscall(format, ...)
#endif

// fast-call entry point, loaded into IA32_LSTAR
extern "C" void __syscall_entry();

namespace cpu::syscall {
    constexpr usize syscall_table_size = 64;

    // rflags the user context resumes with after sysretq
    constexpr u64 sysret_rflags = RFLAGS::IF;

    // masked on entry through IA32_FMASK
    constexpr u64 entry_rflags_mask = RFLAGS::IF | RFLAGS::DF | RFLAGS::TF;

    // syscall loads cs from STAR[47:32] and ss from STAR[47:32] + 8,
    // sysret loads cs from STAR[63:48] + 16 and ss from STAR[63:48] + 8
    constexpr u64 star_value() {
        return (u64(GDTSegment::KERNEL_CODE_64) << 32) | ((u64(GDTSegment::USER_CODE_64) - 16) << 48);
    }

    // arguments arrive in rdi, rsi, rdx, r10, r8; the result goes back in rax
    using Syscall = isize (*)(usize, usize, usize, usize, usize);

    void register_syscall(usize num, const char *name, Syscall fn);
    const char* syscall_name(usize num);

    // per core, stack_top is where __syscall_entry builds its frames
    void init(uptr stack_top);

    [[gnu::format(printf, 1, 2)]] int log_syscall_impl(const char *format, ...);
}
