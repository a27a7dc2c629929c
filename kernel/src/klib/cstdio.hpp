#pragma once

#include <stdarg.h>
#include <klib/common.hpp>
#include <klib/algorithm.hpp>
#include <klib/lock.hpp>

namespace klib {
    int putchar(char c);
    [[gnu::format(printf, 1, 0)]] int vprintf(const char *format, va_list list);
    [[gnu::format(printf, 1, 2)]] int printf(const char *format, ...);
    [[gnu::format(printf, 1, 0)]] int vprintf_unlocked(const char *format, va_list list);
    [[gnu::format(printf, 1, 2)]] int printf_unlocked(const char *format, ...);

    extern klib::Spinlock print_lock;

    // hold across several *_unlocked calls to keep them on one line
    struct PrintGuard {
        InterruptLock interrupt_guard;
        SpinlockGuard<Spinlock> lock_guard;

        PrintGuard() : interrupt_guard(), lock_guard(print_lock) {}
    };

    template<typename F> concept Putchar = requires(F f) { f(' '); };

    struct FormatSpec {
        bool alt_form = false;
        bool zero_padding = false;
        bool long_int = false;
        usize width = 0;
        bool has_precision = false;
        usize precision = 0;
    };

    template<Putchar Put>
    constexpr inline int put_number(Put &put, const FormatSpec &spec, char conv, u64 value, bool negative) {
        int written = 0;
        u64 base = 10;
        if (conv == 'x' || conv == 'X' || conv == 'p')
            base = 16;
        else if (conv == 'o')
            base = 8;

        const char *digits = conv == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
        usize count = num_digits(value, base) + 1;
        usize prefix = negative ? 1 : 0;
        if (spec.alt_form || conv == 'p')
            prefix += base == 16 ? 2 : (base == 8 ? 1 : 0);

        auto emit = [&] (char c) { put(c); written++; };
        auto emit_prefix = [&] () {
            if (negative)
                emit('-');
            if (spec.alt_form || conv == 'p') {
                if (base == 16) {
                    emit('0');
                    emit(conv == 'X' ? 'X' : 'x');
                } else if (base == 8) {
                    emit('0');
                }
            }
        };

        usize padding = spec.width > count + prefix ? spec.width - count - prefix : 0;
        if (spec.zero_padding) {
            emit_prefix();
            for (usize i = 0; i < padding; i++)
                emit('0');
        } else {
            for (usize i = 0; i < padding; i++)
                emit(' ');
            emit_prefix();
        }

        for (isize d = count - 1; d >= 0; d--) {
            u64 v = value;
            for (isize i = 0; i < d; i++)
                v /= base;
            emit(digits[v % base]);
        }
        return written;
    }

    template<Putchar Put>
    [[gnu::format(printf, 2, 0)]] constexpr inline int vprintf_template(Put put, const char *format, va_list list) {
        int written = 0;
        for (usize i = 0; format[i]; i++) {
            if (format[i] != '%') {
                put(format[i]);
                written++;
                continue;
            }

            FormatSpec spec;
            i++;
            while (format[i] == '#' || format[i] == '0') {
                if (format[i] == '#')
                    spec.alt_form = true;
                else
                    spec.zero_padding = true;
                i++;
            }
            if (format[i] == '*') {
                spec.width = va_arg(list, int);
                i++;
            }
            while (format[i] >= '0' && format[i] <= '9')
                spec.width = spec.width * 10 + (format[i++] - '0');
            if (format[i] == '.') {
                spec.has_precision = true;
                i++;
                if (format[i] == '*') {
                    spec.precision = va_arg(list, int);
                    i++;
                }
                while (format[i] >= '0' && format[i] <= '9')
                    spec.precision = spec.precision * 10 + (format[i++] - '0');
            }
            while (format[i] == 'l') {
                spec.long_int = true;
                i++;
            }

            switch (format[i]) {
            case 'd': {
                i64 value = spec.long_int ? va_arg(list, i64) : va_arg(list, i32);
                bool negative = value < 0;
                written += put_number(put, spec, 'd', negative ? -(u64)value : (u64)value, negative);
                break;
            }
            case 'u':
            case 'o':
            case 'x':
            case 'X': {
                u64 value = spec.long_int ? va_arg(list, u64) : va_arg(list, u32);
                written += put_number(put, spec, format[i], value, false);
                break;
            }
            case 'p':
                written += put_number(put, spec, 'p', (u64)va_arg(list, void*), false);
                break;
            case 'c':
                put((char)va_arg(list, int));
                written++;
                break;
            case 's': {
                const char *str = va_arg(list, const char*);
                if (str == nullptr)
                    str = "(null)";
                for (usize j = 0; str[j] && (!spec.has_precision || j < spec.precision); j++) {
                    put(str[j]);
                    written++;
                }
                break;
            }
            case '%':
                put('%');
                written++;
                break;
            case '\0':
                return written;
            default:
                put('%');
                put(format[i]);
                written += 2;
                break;
            }
        }
        return written;
    }

    template<Putchar Put>
    [[gnu::format(printf, 2, 3)]] constexpr inline int printf_template(Put put, const char *format, ...) {
        va_list list;
        va_start(list, format);
        int i = vprintf_template(put, format, list);
        va_end(list);
        return i;
    }
}
