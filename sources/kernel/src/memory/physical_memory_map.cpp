#include "memory/physical_memory_map.hpp"

#include "panic.hpp"

static constinit kr::PhysicalMemoryMap gPhysicalMemoryMap {
    *kr::VirtualAddress::fromInteger(kr::kPhysicalMemoryMapBase),
    kr::kPhysicalMemoryMapMaxSize,
};

std::optional<kr::VirtualAddress> kr::PhysicalMemoryMap::mapped(PhysicalAddress paddr) const noexcept {
    if (paddr.toInteger() >= size()) {
        return std::nullopt;
    }

    return mBase.offset(paddr.toInteger());
}

size_t kr::PhysicalMemoryMap::extend(size_t newSize) {
    KR_CHECK(newSize <= mMaxSize, "Physical memory map extended past its reserved range.");

    //
    // Equivalent to an atomic fetch_max. The release half publishes the page table
    // writes that made [0, newSize) accessible before the new size becomes visible.
    //
    size_t current = mSize.load(std::memory_order_acquire);
    while (current < newSize) {
        if (mSize.compare_exchange_weak(current, newSize, std::memory_order_acq_rel, std::memory_order_acquire)) {
            break;
        }
    }

    return current;
}

std::optional<kr::VirtualAddress> kr::IdentityMapped(PhysicalAddress paddr, size_t identityMappedSize) noexcept {
    if (paddr.toInteger() >= identityMappedSize) {
        return std::nullopt;
    }

    return VirtualAddress::fromInteger(paddr.toInteger());
}

kr::PhysicalMemoryMap& kr::GetPhysicalMemoryMap() noexcept {
    return gPhysicalMemoryMap;
}
