#pragma once

#include "arch/isr.hpp"
#include "arch/intrin.hpp"
#include "arch/x86_64/atomic.hpp"

#include "isr/vector.hpp"
#include "util/util.hpp"

#include <optional>

namespace kr {
    /// @brief The interrupt descriptor table.
    ///
    /// Entries are read and written atomically, an interrupt that fires while an entry
    /// is being replaced sees either the old or the new gate. Empty entries are zero
    /// and not present.
    class alignas(16) InterruptDescriptorTable {
        x64::Atomic128<x64::GateDescriptor> mEntries[isr::kIsrCount];

    public:
        UTIL_NOCOPY(InterruptDescriptorTable);
        UTIL_NOMOVE(InterruptDescriptorTable);

        constexpr InterruptDescriptorTable() noexcept = default;

        /// @brief Install a handler in the current code segment.
        void install(Vector vector, uintptr_t handler);

        /// @brief Install a handler.
        ///
        /// @param vector The vector to handle.
        /// @param handler Address of the handler, must stay mapped while the table is active.
        /// @param selector Code segment selector of the handler.
        /// @param ist Interrupt stack table index.
        void install(Vector vector, uintptr_t handler, uint16_t selector, uint8_t ist);

        /// @brief Remove the gate for a vector, raising the vector will fault.
        void remove(Vector vector);

        std::optional<x64::GateDescriptor> entry(Vector vector) const;

        IDTR idtr() const;

        /// @brief Load this table into the processor.
        ///
        /// @pre The double fault handler is installed.
        /// @pre The table remains at this address while active.
        void activate() const;
    };

    static_assert(sizeof(InterruptDescriptorTable) == isr::kIsrCount * sizeof(x64::GateDescriptor));

    /// @brief The kernel's interrupt descriptor table.
    InterruptDescriptorTable& GetInterruptDescriptorTable();
}
