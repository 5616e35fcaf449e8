#include <string.h>
#include <stdint.h>

#include <exception>
#include <new>

#include "panic.hpp"

//
// The kernel has no heap at this stage, nothing should ever be deleted.
// Deleting destructors of polymorphic types still reference operator delete.
//
// memcpy and memset must not be written as loops, the compiler turns those
// back into calls to memcpy and memset.
//

extern "C" void __cxa_pure_virtual() {
    KR_PANIC("Pure virtual function called.");
}

void std::terminate() noexcept {
    KR_PANIC("std::terminate() called");
}

extern "C" void abort() {
    KR_PANIC("abort() called");
}

void operator delete(void *) noexcept {
    KR_PANIC("operator delete called without a heap.");
}

void operator delete(void *, std::size_t) noexcept {
    KR_PANIC("operator delete called without a heap.");
}

__attribute__((__nothrow__, __nonnull__, __returns_nonnull__))
extern "C" void *memcpy(void *dest, const void *source, size_t n) {
    void *dst = dest;
    asm volatile("rep movsb" : "+D"(dst), "+S"(source), "+c"(n) : : "memory");
    return dest;
}

__attribute__((__nothrow__, __nonnull__, __returns_nonnull__))
extern "C" void *memset(void *dst, int value, size_t n) {
    void *front = dst;
    asm volatile("rep stosb" : "+D"(front), "+c"(n) : "a"(value) : "memory");
    return dst;
}

__attribute__((__nothrow__, __nonnull__, __returns_nonnull__))
extern "C" void *memmove(void *dest, const void *src, size_t n) {
    uint8_t *pdest = (uint8_t *)dest;
    const uint8_t *psrc = (const uint8_t *)src;

    if (src > dest) {
        for (size_t i = 0; i < n; i++) {
            pdest[i] = psrc[i];
        }
    } else if (src < dest) {
        for (size_t i = n; i > 0; i--) {
            pdest[i-1] = psrc[i-1];
        }
    }

    return dest;
}

__attribute__((__nothrow__, __nonnull__))
extern "C" int memcmp(const void *s1, const void *s2, size_t n) {
    const uint8_t *p1 = (const uint8_t *)s1;
    const uint8_t *p2 = (const uint8_t *)s2;

    for (size_t i = 0; i < n; i++) {
        if (p1[i] != p2[i]) {
            return p1[i] < p2[i] ? -1 : 1;
        }
    }

    return 0;
}
