#include <klib/cstdio.hpp>
#include <cpu/cpu.hpp>

namespace klib {
    static constexpr u16 com1 = 0x3F8;

    klib::Spinlock print_lock;

    static void serial_putchar(char c) {
        // wait for the transmit holding register to drain
        while ((cpu::in<u8>(com1 + 5) & 0x20) == 0)
            asm volatile("pause");
        cpu::out<u8>(com1, c);
    }

    int putchar(char c) {
        if (c == '\n')
            serial_putchar('\r');
        serial_putchar(c);
        return c;
    }

    int vprintf_unlocked(const char *format, va_list list) {
        return vprintf_template(putchar, format, list);
    }

    int printf_unlocked(const char *format, ...) {
        va_list list;
        va_start(list, format);
        int i = vprintf_unlocked(format, list);
        va_end(list);
        return i;
    }

    int vprintf(const char *format, va_list list) {
        PrintGuard print_guard;
        return vprintf_unlocked(format, list);
    }

    int printf(const char *format, ...) {
        va_list list;
        va_start(list, format);
        int i = vprintf(format, list);
        va_end(list);
        return i;
    }
}
