#pragma once

#include "util/format.hpp"

#include <compare>
#include <stdint.h>

namespace kr {
    /// @brief Interrupt vector numbers.
    namespace isr {
        // vectors for architectural exceptions

        constexpr uint8_t DE = 0x0;
        constexpr uint8_t DB = 0x1;
        constexpr uint8_t NMI = 0x2;
        constexpr uint8_t BP = 0x3;
        constexpr uint8_t OF = 0x4;
        constexpr uint8_t BR = 0x5;
        constexpr uint8_t UD = 0x6;
        constexpr uint8_t NM = 0x7;
        constexpr uint8_t DF = 0x8;
        constexpr uint8_t TS = 0xA;
        constexpr uint8_t NP = 0xB;
        constexpr uint8_t SS = 0xC;
        constexpr uint8_t GP = 0xD;
        constexpr uint8_t PF = 0xE;
        constexpr uint8_t MF = 0x10;
        constexpr uint8_t AC = 0x11;
        constexpr uint8_t MC = 0x12;
        constexpr uint8_t XM = 0x13;
        constexpr uint8_t VE = 0x14;
        constexpr uint8_t CP = 0x15;
        constexpr uint8_t HV = 0x1C;
        constexpr uint8_t VC = 0x1D;
        constexpr uint8_t SX = 0x1E;

        /// @brief The number of exceptions reserved by the CPU
        constexpr size_t kExceptionCount = 0x20;

        /// @brief The total number of ISRs the CPU supports
        constexpr size_t kIsrCount = 256;
    }

    /// @brief An interrupt vector.
    ///
    /// Vectors below 32 are reserved for architectural exceptions,
    /// the rest are available for external and software interrupts.
    class Vector {
        uint8_t mValue;

    public:
        constexpr Vector(uint8_t value) noexcept
            : mValue(value)
        { }

        constexpr uint8_t value() const noexcept { return mValue; }

        constexpr bool isException() const noexcept {
            return mValue < isr::kExceptionCount;
        }

        constexpr bool isUserInterrupt() const noexcept {
            return mValue >= isr::kExceptionCount;
        }

        constexpr auto operator<=>(const Vector&) const noexcept = default;
    };
}

template<>
struct kr::Format<kr::Vector> {
    static void format(kr::IOutStream& out, kr::Vector value);
};
