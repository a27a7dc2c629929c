#include <klib/cstring.hpp>

extern "C" {
    void* memcpy(void *dst, const void *src, usize size) {
        void *ret = dst;
        asm volatile("rep movsb" : "+D" (dst), "+S" (src), "+c" (size) : : "memory");
        return ret;
    }

    void* memmove(void *dst, const void *src, usize size) {
        if (uptr(dst) <= uptr(src) || uptr(dst) >= uptr(src) + size)
            return memcpy(dst, src, size);

        // overlapping with dst above src, copy backwards
        void *ret = dst;
        dst = (u8*)dst + size - 1;
        src = (const u8*)src + size - 1;
        asm volatile("std; rep movsb; cld" : "+D" (dst), "+S" (src), "+c" (size) : : "memory");
        return ret;
    }

    void* memset(void *dst, int value, usize size) {
        void *ret = dst;
        asm volatile("rep stosb" : "+D" (dst), "+c" (size) : "a" (value) : "memory");
        return ret;
    }

    int memcmp(const void *lhs, const void *rhs, usize size) {
        auto *a = (const u8*)lhs;
        auto *b = (const u8*)rhs;
        for (usize i = 0; i < size; i++) {
            if (a[i] != b[i])
                return a[i] - b[i];
        }
        return 0;
    }
}
