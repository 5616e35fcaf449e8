#pragma once

#include "memory/layout.hpp"

#include <atomic>
#include <optional>

namespace kr {
    /// @brief A window of virtual memory that exposes physical memory.
    ///
    /// Physical address @a p is readable at @a base + @a p once @a p is below
    /// the current size. The size only ever grows, and is only grown after the
    /// memory below it has been mapped, so a reader never observes a size that
    /// covers memory without a mapping.
    class PhysicalMemoryMap {
        VirtualAddress mBase;
        size_t mMaxSize;
        std::atomic<size_t> mSize;

    public:
        constexpr PhysicalMemoryMap(VirtualAddress base, size_t maxSize) noexcept
            : mBase(base)
            , mMaxSize(maxSize)
            , mSize(0)
        { }

        constexpr VirtualAddress base() const noexcept { return mBase; }
        constexpr size_t maxSize() const noexcept { return mMaxSize; }

        size_t size(std::memory_order order = std::memory_order_acquire) const noexcept {
            return mSize.load(order);
        }

        /// @brief Get the virtual address of a physical address.
        ///
        /// @param paddr The physical address.
        ///
        /// @return The mapped address, or nothing if @p paddr is not mapped yet.
        std::optional<VirtualAddress> mapped(PhysicalAddress paddr) const noexcept;

        /// @brief Grow the mapped size to at least @p newSize bytes.
        ///
        /// @pre The memory in [0, @p newSize) is mapped at @ref base.
        ///
        /// @return The size before the call.
        size_t extend(size_t newSize);
    };

    /// @brief Get the address of physical memory through the boot identity mapping.
    ///
    /// @param paddr The physical address.
    /// @param identityMappedSize The amount of memory the boot environment identity mapped.
    ///
    /// @return The identity mapped address, or nothing if @p paddr is not identity mapped.
    std::optional<VirtualAddress> IdentityMapped(PhysicalAddress paddr, size_t identityMappedSize) noexcept;

    /// @brief The kernel's physical memory map.
    PhysicalMemoryMap& GetPhysicalMemoryMap() noexcept;
}
