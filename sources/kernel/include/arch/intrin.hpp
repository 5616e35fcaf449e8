#pragma once

#include <stdint.h>
#include <stddef.h>

//
// Hosted builds (unit tests) route every privileged instruction through
// a replaceable implementation, freestanding builds execute them directly.
//
#if __STDC_HOSTED__
#   include "arch/hosted/intrin.hpp"
#elif defined(__x86_64__)
#   include "arch/x86_64/intrin.hpp"
#else
#   error "Unsupported architecture"
#endif

#define __DEFAULT_FN_ATTRS __attribute__((__always_inline__, unused))

static inline void __DEFAULT_FN_ATTRS __cli(void) {
    arch::Intrin::cli();
}

static inline void __DEFAULT_FN_ATTRS __sti(void) {
    arch::Intrin::sti();
}

static inline void __DEFAULT_FN_ATTRS __halt(void) {
    arch::Intrin::halt();
}

static inline void __DEFAULT_FN_ATTRS __invlpg(uintptr_t address) {
    arch::Intrin::invlpg(address);
}

static inline void __DEFAULT_FN_ATTRS __lidt(const IDTR& idtr) {
    arch::Intrin::lidt(idtr);
}

[[nodiscard]]
static inline uint64_t __DEFAULT_FN_ATTRS __get_cr3(void) {
    return arch::Intrin::readCr3();
}

[[nodiscard]]
static inline uint64_t __DEFAULT_FN_ATTRS __get_cr2(void) {
    return arch::Intrin::readCr2();
}

[[nodiscard]]
static inline uint16_t __DEFAULT_FN_ATTRS __get_cs(void) {
    return arch::Intrin::readCs();
}

#undef __DEFAULT_FN_ATTRS
