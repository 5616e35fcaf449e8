#pragma once

#include "arch/generic/intrin.hpp"

namespace arch {
    struct IntrinX86_64 : GenericIntrin {
        [[gnu::always_inline]]
        static void pause() noexcept {
            asm volatile("pause");
        }

        [[gnu::always_inline]]
        static void halt() noexcept {
            asm volatile("hlt");
        }

        [[gnu::always_inline]]
        static void cli() noexcept {
            asm volatile("cli");
        }

        [[gnu::always_inline]]
        static void sti() noexcept {
            asm volatile("sti");
        }

        [[gnu::always_inline]]
        static void invlpg(uintptr_t address) noexcept {
            asm volatile("invlpg (%0)" : : "r"(address) : "memory");
        }

        [[gnu::always_inline]]
        static void lidt(const IDTR& idtr) noexcept {
            asm volatile("lidt %0" :: "m"(idtr) : "memory");
        }

        [[gnu::always_inline, nodiscard]]
        static uint64_t readCr3() noexcept {
            uint64_t value;
            asm volatile("mov %%cr3, %0" : "=r"(value));
            return value;
        }

        [[gnu::always_inline, nodiscard]]
        static uint64_t readCr2() noexcept {
            uint64_t value;
            asm volatile("mov %%cr2, %0" : "=r"(value));
            return value;
        }

        [[gnu::always_inline, nodiscard]]
        static uint16_t readCs() noexcept {
            uint16_t value;
            asm volatile("mov %%cs, %0" : "=r"(value));
            return value;
        }

        [[gnu::always_inline]]
        static void outbyte(uint16_t port, uint8_t data) noexcept {
            asm volatile("outb %b0, %w1" : : "a"(data), "Nd"(port));
        }

        [[gnu::always_inline]]
        static uint8_t inbyte(uint16_t port) noexcept {
            uint8_t ret;
            asm volatile("inb %w1, %b0" : "=a"(ret) : "Nd"(port));
            return ret;
        }
    };

    using Intrin = IntrinX86_64;
}
