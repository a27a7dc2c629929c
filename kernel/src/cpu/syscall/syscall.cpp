#include <cpu/syscall/syscall.hpp>
#include <klib/cstdio.hpp>
#include <panic.hpp>
#include <errno.h>

namespace cpu::syscall {
    static Syscall syscall_table[syscall_table_size] = {};
    static const char *syscall_name_table[syscall_table_size] = {};

    void register_syscall(usize num, const char *name, Syscall fn) {
        ASSERT(num < syscall_table_size);
        ASSERT(fn != nullptr);
        ASSERT(!syscall_name_table[num]);
        syscall_table[num] = fn;
        syscall_name_table[num] = name;
    }

    const char* syscall_name(usize num) {
        if (num >= syscall_table_size)
            return nullptr;
        return syscall_name_table[num];
    }

    extern "C" void syscall_handler(TrapFrame *frame) {
        usize syscall_num = frame->rax;

        if (syscall_num >= syscall_table_size || syscall_table[syscall_num] == nullptr) {
            frame->rax = -ENOSYS;
#if TRAPGATE_SYSCALL_TRACE || TRAPGATE_UNIMPLEMENTED_SYSCALL_TRACE
            klib::printf("Syscall: !! unimplemented syscall: %lu (rip %#lX) !!\n", syscall_num, frame->rip);
#endif
            return;
        }

        log_syscall("%s(%#lX, %#lX, %#lX, %#lX, %#lX)\n", syscall_name_table[syscall_num],
            frame->rdi, frame->rsi, frame->rdx, frame->r10, frame->r8);

        auto *syscall = syscall_table[syscall_num];
        frame->rax = syscall(frame->rdi, frame->rsi, frame->rdx, frame->r10, frame->r8);

#if TRAPGATE_SYSCALL_TRACE
        if ((isize)frame->rax >= 0)
            log_syscall("%s return: %#lX\n", syscall_name_table[syscall_num], frame->rax);
        else
            log_syscall("%s return errno: %ld\n", syscall_name_table[syscall_num], -(isize)frame->rax);
#endif
    }

    int log_syscall_impl(const char *format, ...) {
        klib::PrintGuard print_guard;
        klib::printf_unlocked("Syscall: ");

        va_list list;
        va_start(list, format);
        int i = klib::vprintf_unlocked(format, list);
        va_end(list);
        return i;
    }

    void init(uptr stack_top) {
        // __syscall_entry reads the stack back from edx:eax
        MSR::write(MSR::IA32_SYSENTER_ESP, stack_top);

        // enable syscall/sysret instructions
        MSR::write(MSR::IA32_EFER, MSR::read(MSR::IA32_EFER) | EFER::SCE);

        MSR::write(MSR::IA32_FMASK, entry_rflags_mask);
        MSR::write(MSR::IA32_STAR, star_value());
        MSR::write(MSR::IA32_LSTAR, (u64)&__syscall_entry);
    }
}
