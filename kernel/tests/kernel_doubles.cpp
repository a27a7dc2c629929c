#include "kernel_doubles.hpp"

#include <klib/cstdio.hpp>
#include <panic.hpp>

namespace test {
    static std::string log_buffer;

    const std::string& kernel_log() {
        return log_buffer;
    }

    void clear_log() {
        log_buffer.clear();
    }
}

namespace klib {
    klib::Spinlock print_lock;

    int putchar(char c) {
        test::log_buffer += c;
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

[[noreturn]] void panic(const char *format, ...) {
    std::string message;
    va_list list;
    va_start(list, format);
    klib::vprintf_template([&] (char c) { message += c; }, format, list);
    va_end(list);
    test::log_buffer += "Kernel Panic: " + message + "\n";
    throw test::KernelPanic(message);
}
