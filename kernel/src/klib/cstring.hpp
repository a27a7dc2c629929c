#pragma once

#include <klib/common.hpp>

// the compiler emits calls to these even in freestanding code
extern "C" int memcmp(const void *lhs, const void *rhs, usize size);
extern "C" void* memcpy(void *dst, const void *src, usize size);
extern "C" void* memmove(void *dst, const void *src, usize size);
extern "C" void* memset(void *dst, int value, usize size);
