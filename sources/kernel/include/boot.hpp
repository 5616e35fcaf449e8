#pragma once

#include <kestrel/status.h>

#include "memory/layout.hpp"

#include <span>

namespace kr {
    enum class MemoryRegionKind : uint8_t {
        eUsed,
        eFree,
        eAcpi,
        eMmio,
    };

    /// @brief A range of physical memory reported by the bootloader.
    struct MemoryRegion {
        PhysicalAddress front;
        size_t size;
        MemoryRegionKind kind;

        bool isFree() const { return kind == MemoryRegionKind::eFree; }

        /// @brief One past the last byte, saturated at the top of the address space.
        uintptr_t back() const;
    };
}

namespace kr {
    /// @brief The end of the highest region that is backed by memory.
    ///
    /// MMIO regions are not counted.
    size_t GetPhysicalMemorySize(std::span<const MemoryRegion> regions);
}

template<>
struct kr::Format<kr::MemoryRegionKind> {
    static void format(kr::IOutStream& out, kr::MemoryRegionKind value);
};

namespace boot {
    /// @brief BOOTBOOT identity maps the first 16G of physical memory.
    static constexpr size_t kBootbootIdentityMappedSize = 16 * kr::kGigabyte;

    /// @brief A BOOTBOOT memory map entry.
    ///
    /// The low 4 bits of @a size hold the region type.
    struct MMapEnt {
        uint64_t ptr;
        uint64_t size;
    };

    static_assert(sizeof(MMapEnt) == 16);

    static constexpr uint64_t kMMapTypeMask = 0xF;

    enum MMapType : uint8_t {
        eMMapUsed = 0,
        eMMapFree = 1,
        eMMapAcpi = 2,
        eMMapMmio = 3,
    };

    /// @brief Decode a single memory map entry.
    ///
    /// @param entry The entry to decode.
    /// @param region The decoded region.
    ///
    /// @retval OsStatusSuccess The entry was decoded.
    /// @retval OsStatusInvalidData The entry has an unknown type.
    /// @retval OsStatusInvalidAddress The entry starts past the physical address width.
    OsStatus DecodeMemoryEntry(MMapEnt entry, kr::MemoryRegion *region);

    /// @brief Decode a BOOTBOOT memory map.
    ///
    /// Stops at the first entry that fails to decode, or when @p regions is full.
    /// @p count is always written with the number of regions decoded so far.
    ///
    /// @param entries The raw memory map.
    /// @param regions Storage for the decoded regions.
    /// @param count The number of decoded regions.
    ///
    /// @retval OsStatusSuccess Every entry was decoded.
    /// @retval OsStatusOutOfMemory @p regions is too small for @p entries, the first
    ///         `regions.size()` entries were decoded.
    OsStatus DecodeMemoryMap(std::span<const MMapEnt> entries, std::span<kr::MemoryRegion> regions, size_t *count);
}
