#include <panic.hpp>
#include <klib/cstdio.hpp>

[[noreturn]] void panic(const char *format, ...) {
    asm volatile("cli");
    klib::printf_unlocked("\nKernel Panic: ");
    va_list list;
    va_start(list, format);
    klib::vprintf_unlocked(format, list);
    va_end(list);
    StackFrame *frame = (StackFrame*)__builtin_frame_address(0);
    klib::printf_unlocked("\nStacktrace:\n");
    while (true) {
        if (frame == nullptr || frame->ip == 0)
            break;

        klib::printf_unlocked("%#lX\n", frame->ip);
        frame = frame->next;
    }
    halt();
}
