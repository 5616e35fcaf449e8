#pragma once

#include <kestrel/status.h>

#include "isr/exceptions.hpp"
#include "memory/pager.hpp"

#include <atomic>

namespace kr {
    struct ArchSetupParams {
        /// @brief The amount of physical memory to map.
        size_t memSize;

        /// @brief The amount of physical memory the bootloader identity mapped.
        size_t identityMappedSize;

        /// @brief Frames for page tables.
        IFrameSource *frames;
    };

    /// @brief The tables that setup populates.
    struct ArchTables {
        IsrTable *isrTable;
        InterruptDescriptorTable *idt;
        PhysicalMemoryMap *memoryMap;
    };

    /// @brief Brings up interrupts and the physical memory map.
    ///
    /// Only the first call to @ref setup does anything. Later calls wait for the
    /// first to finish and return its status without touching any table.
    class ArchSetup {
        std::atomic_flag mStarted = ATOMIC_FLAG_INIT;
        std::atomic<bool> mFinished { false };
        std::atomic<bool> mComplete { false };
        OsStatus mStatus = OsStatusSuccess;

        OsStatus finish(OsStatus status);

        static OsStatus setupInterrupts(const ArchTables& tables);

        /// @brief Check that the last byte mapped translates back to its physical address.
        static OsStatus verifyMapping(const Pager& pager, const ArchTables& tables, const ArchSetupParams& params, size_t mapped);

    public:
        UTIL_NOCOPY(ArchSetup);
        UTIL_NOMOVE(ArchSetup);

        constexpr ArchSetup() noexcept = default;

        /// @brief Set up the architecture.
        ///
        /// Validates the vector table, installs the exception handlers and the gates
        /// for every vector, activates the descriptor table, then maps physical memory
        /// with the page tables in cr3.
        ///
        /// @param tables The tables to populate.
        /// @param params The boot parameters.
        /// @param mapped The amount of physical memory mapped by this call.
        ///
        /// @return The status of physical memory mapping, or the validation failure.
        ///         Later calls return the status of the first call.
        OsStatus setup(const ArchTables& tables, const ArchSetupParams& params, size_t *mapped);

        /// @brief Has a call to @ref setup run to completion.
        bool isComplete() const noexcept {
            return mComplete.load(std::memory_order_acquire);
        }
    };

    /// @brief Set up the architecture with the kernel's global tables.
    OsStatus SetupArch(const ArchSetupParams& params, size_t *mapped);
}
