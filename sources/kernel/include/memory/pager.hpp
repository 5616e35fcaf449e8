#pragma once

#include <kestrel/status.h>

#include "memory/frames.hpp"
#include "memory/physical_memory_map.hpp"

#include "arch/paging.hpp"

namespace kr {
    /// @brief Finds page tables while the physical memory map is being built.
    ///
    /// Tables are reached through the physical memory map once it covers them,
    /// and through the bootloader's identity mapping before then.
    class MaybeIdentityMapped {
        const PhysicalMemoryMap *mMap;
        size_t mIdentityMappedSize;

    public:
        constexpr MaybeIdentityMapped(const PhysicalMemoryMap& map, size_t identityMappedSize) noexcept
            : mMap(&map)
            , mIdentityMappedSize(identityMappedSize)
        { }

        std::optional<VirtualAddress> translate(PhysicalAddress paddr) const noexcept;

        template<typename T>
        T *table(PhysicalAddress paddr) const noexcept {
            if (std::optional<VirtualAddress> vaddr = translate(paddr)) {
                return vaddr->as<T>();
            }

            return nullptr;
        }
    };

    /// @brief A page table hierarchy.
    class Pager {
        PhysicalAddress mRoot;

        Pager(PhysicalAddress root) noexcept
            : mRoot(root)
        { }

        x64::PageMapLevel3 *getPageMap3(const MaybeIdentityMapped& tables, x64::PageMapLevel4 *l4, uint16_t pml4e, IFrameSource& frames, OsStatus *status);
        x64::PageMapLevel2 *getPageMap2(const MaybeIdentityMapped& tables, x64::PageMapLevel3 *l3, uint16_t pdpte, IFrameSource& frames, OsStatus *status);

        OsStatus mapLargePage(const MaybeIdentityMapped& tables, x64::PageMapLevel4 *l4, VirtualAddress vaddr, PhysicalAddress paddr, IFrameSource& frames);

    public:
        /// @brief The page tables that are currently active on this processor.
        static Pager current();

        PhysicalAddress root() const noexcept { return mRoot; }

        /// @brief Map physical memory into the physical memory map.
        ///
        /// Maps [0, @p memSize) in 2m pages at the base of @p map, extending @p map after
        /// every page. Page tables are allocated from @p frames. A failure leaves the pages
        /// mapped so far in place, @p map covers exactly those pages.
        ///
        /// @pre [0, @p identityMappedSize) is identity mapped.
        /// @pre The virtual range of @p map is not used for anything else.
        /// @pre Every frame in @p frames is unused and none of them are frame zero.
        ///
        /// @param map The memory map to populate.
        /// @param memSize The amount of physical memory to map.
        /// @param identityMappedSize The amount of physical memory that is identity mapped.
        /// @param frames Frames for new page tables.
        /// @param mapped The number of bytes mapped, may exceed @p memSize by less than a 2m page.
        ///
        /// @retval OsStatusSuccess All memory was mapped.
        /// @retval OsStatusInvalidInput @p memSize is larger than the memory map.
        /// @retval OsStatusOutOfMemory @p frames ran out before all memory was mapped.
        /// @retval OsStatusAlreadyExists Part of the memory map was already mapped.
        /// @retval OsStatusInvalidData The memory map overlaps a 1g page.
        /// @retval OsStatusInvalidAddress A page table is not reachable.
        OsStatus mapPhysicalMemory(PhysicalMemoryMap& map, size_t memSize, size_t identityMappedSize, IFrameSource& frames, size_t *mapped);

        /// @brief Map physical memory into the kernel's physical memory map.
        OsStatus mapPhysicalMemory(size_t memSize, size_t identityMappedSize, IFrameSource& frames, size_t *mapped);

        /// @brief Find the physical address a virtual address is mapped to.
        ///
        /// @return The physical address, or nothing if @p vaddr is not mapped.
        std::optional<PhysicalAddress> translate(const MaybeIdentityMapped& tables, VirtualAddress vaddr) const;
    };
}
