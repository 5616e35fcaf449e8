#pragma once

#include "common/physical_address.hpp"
#include "common/virtual_address.hpp"

#include "arch/paging.hpp"
#include "util/format.hpp"
#include "util/util.hpp"

#include <stddef.h>
#include <stdint.h>

namespace kr {
    using PhysicalAddress = sm::PhysicalAddress;
    using VirtualAddress = sm::VirtualAddress;

    /// @brief Virtual address where all of physical memory is mapped.
    ///
    /// The start of the higher half, pml4 entry 256.
    static constexpr uintptr_t kPhysicalMemoryMapBase = 0xffff'8000'0000'0000;

    /// @brief The largest amount of physical memory that fits in the physical memory map.
    ///
    /// A quarter of the higher half, the rest is kept for the kernel image and heaps.
    static constexpr size_t kPhysicalMemoryMapMaxSize = 0x0000'4000'0000'0000;

    static_assert(sm::VirtualAddress::fromInteger(kPhysicalMemoryMapBase).has_value());
    static_assert(sm::VirtualAddress::fromInteger(kPhysicalMemoryMapBase + kPhysicalMemoryMapMaxSize - 1).has_value());

    static constexpr size_t kGigabyte = 0x4000'0000;

    /// @brief Returns the number of 2m pages required to store the given number of bytes.
    constexpr size_t LargePages(size_t bytes) {
        return sm::roundup(bytes, x64::kLargePageSize) / x64::kLargePageSize;
    }
}

template<typename AddressSpace>
struct kr::Format<sm::Address<AddressSpace>> {
    using Value = sm::Address<AddressSpace>;

    static constexpr size_t kStringSize = kr::kFormatSize<kr::Hex<uintptr_t>>;

    static stdx::StringView toString(char *buffer, Value value) {
        return kr::Format<kr::Hex<uintptr_t>>::toString(buffer, kr::Hex(value.toInteger()).pad(16, '0'));
    }
};
