#pragma once

#include <stdint.h>

/// @brief Operand of the lidt instruction.
struct [[gnu::packed]] alignas(16) IDTR {
    uint16_t limit;
    uint64_t base;
};

namespace arch {
    struct GenericIntrin {
        /// @brief Spin loop hint.
        [[gnu::error("pause not implemented by platform")]]
        static void pause() noexcept;

        /// @brief Halt the CPU until the next interrupt.
        [[gnu::error("hlt not implemented by platform")]]
        static void halt() noexcept;

        /// @brief Disable interrupts.
        [[gnu::error("cli not implemented by platform")]]
        static void cli() noexcept;

        /// @brief Enable interrupts.
        [[gnu::error("sti not implemented by platform")]]
        static void sti() noexcept;

        /// @brief Invalidate the TLB entry for the given address.
        [[gnu::error("invlpg not implemented by platform")]]
        static void invlpg(uintptr_t address) noexcept;

        /// @brief Load the interrupt descriptor table register.
        [[gnu::error("lidt not implemented by platform")]]
        static void lidt(const IDTR& idtr) noexcept;

        /// @brief Read the physical address and flags of the active top level page table.
        [[gnu::error("readCr3 not implemented by platform"), nodiscard]]
        static uint64_t readCr3() noexcept;

        /// @brief Read the linear address that caused the last page fault.
        [[gnu::error("readCr2 not implemented by platform"), nodiscard]]
        static uint64_t readCr2() noexcept;

        /// @brief Read the current code segment selector.
        [[gnu::error("readCs not implemented by platform"), nodiscard]]
        static uint16_t readCs() noexcept;

        [[gnu::error("outbyte not implemented by platform")]]
        static void outbyte(uint16_t port, uint8_t value) noexcept;

        [[gnu::error("inbyte not implemented by platform")]]
        static uint8_t inbyte(uint16_t port) noexcept;
    };
}
