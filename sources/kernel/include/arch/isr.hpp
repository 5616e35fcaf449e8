#pragma once

#include <stddef.h>
#include <stdint.h>
#include <utility>

namespace x64 {
    namespace idt {
        static constexpr uint8_t kFlagPresent = (1 << 7);
        static constexpr uint8_t kInterruptGate = 0b1110;
        // static constexpr uint8_t kTrapGate = 0b1111;
    }

    enum class Privilege : uint8_t {
        eSupervisor = 0,
        eUser = 3,
    };

    /// @brief An entry in the interrupt descriptor table.
    struct GateDescriptor {
        uint16_t address0;
        uint16_t selector;
        uint8_t ist;
        uint8_t flags;
        uint16_t address1;
        uint32_t address2;
        uint32_t reserved;

        /// @brief Create a present interrupt gate.
        ///
        /// @param handler The address of the handler.
        /// @param selector The code segment selector to run the handler in.
        /// @param ist The interrupt stack table index, 0 for the current stack.
        /// @param dpl The most privileged level allowed to raise the vector with int.
        static constexpr GateDescriptor create(uintptr_t handler, uint16_t selector, uint8_t ist = 0, Privilege dpl = Privilege::eSupervisor) noexcept {
            uint8_t flags = idt::kFlagPresent | idt::kInterruptGate | ((std::to_underlying(dpl) & 0b11) << 5);

            return GateDescriptor {
                .address0 = uint16_t(handler & 0xFFFF),
                .selector = selector,
                .ist = uint8_t(ist & 0b111),
                .flags = flags,
                .address1 = uint16_t((handler >> 16) & 0xFFFF),
                .address2 = uint32_t(handler >> 32),
                .reserved = 0,
            };
        }

        constexpr uintptr_t address() const noexcept {
            return uintptr_t(address0) | (uintptr_t(address1) << 16) | (uintptr_t(address2) << 32);
        }

        constexpr bool isPresent() const noexcept {
            return flags & idt::kFlagPresent;
        }

        constexpr Privilege privilege() const noexcept {
            return Privilege((flags >> 5) & 0b11);
        }

        constexpr bool operator==(const GateDescriptor&) const noexcept = default;
    };

    static_assert(sizeof(GateDescriptor) == 16);
    static_assert(offsetof(GateDescriptor, selector) == 2);
    static_assert(offsetof(GateDescriptor, ist) == 4);
    static_assert(offsetof(GateDescriptor, flags) == 5);
    static_assert(offsetof(GateDescriptor, address1) == 6);
    static_assert(offsetof(GateDescriptor, address2) == 8);
    static_assert(offsetof(GateDescriptor, reserved) == 12);

    static_assert(GateDescriptor::create(0, 0x08).flags == 0x8E);
    static_assert(GateDescriptor::create(0x1234'5678'9abc'def0, 0x08).address() == 0x1234'5678'9abc'def0);
}
