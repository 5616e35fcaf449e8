#include "memory/pager.hpp"

#include "arch/cr3.hpp"
#include "logger/categories.hpp"
#include "panic.hpp"

#include <string.h>

using namespace kr;

static constexpr uint64_t kMiddleFlags = x64::paging::kPresentBit | x64::paging::kWriteableBit;

std::optional<VirtualAddress> MaybeIdentityMapped::translate(PhysicalAddress paddr) const noexcept {
    if (std::optional<VirtualAddress> vaddr = mMap->mapped(paddr)) {
        return vaddr;
    }

    return IdentityMapped(paddr, mIdentityMappedSize);
}

Pager Pager::current() {
    x64::Cr3 cr3 = x64::Cr3::load();

    // the mask keeps the address inside the physical address width
    std::optional<PhysicalAddress> root = PhysicalAddress::fromInteger(cr3.address());
    KR_ASSERT(root.has_value());

    return Pager(*root);
}

template<typename T>
static T *AllocateTable(const MaybeIdentityMapped& tables, x64::Entry& entry, IFrameSource& frames, OsStatus *status) {
    std::optional<PhysicalAddress> frame = frames.next();
    if (!frame.has_value()) {
        *status = OsStatusOutOfMemory;
        return nullptr;
    }

    T *table = tables.table<T>(*frame);
    if (table == nullptr) {
        MemLog.warnf("Page table frame ", *frame, " is not accessible.");
        *status = OsStatusInvalidAddress;
        return nullptr;
    }

    memset(table, 0, sizeof(T));

    entry.underlying = kMiddleFlags;
    entry.setAddress(frame->toInteger());

    *status = OsStatusSuccess;
    return table;
}

template<typename T>
static T *FindTable(const MaybeIdentityMapped& tables, const x64::Entry& entry, OsStatus *status) {
    // frame addresses are masked to 52 bits and are always valid
    PhysicalAddress paddr = *PhysicalAddress::fromInteger(entry.address());

    T *table = tables.table<T>(paddr);
    if (table == nullptr) {
        MemLog.warnf("Page table ", paddr, " is not accessible.");
        *status = OsStatusInvalidAddress;
        return nullptr;
    }

    *status = OsStatusSuccess;
    return table;
}

x64::PageMapLevel3 *Pager::getPageMap3(const MaybeIdentityMapped& tables, x64::PageMapLevel4 *l4, uint16_t pml4e, IFrameSource& frames, OsStatus *status) {
    x64::pml4e& t4 = l4->entries[pml4e];
    if (!t4.present()) {
        return AllocateTable<x64::PageMapLevel3>(tables, t4, frames, status);
    }

    return FindTable<x64::PageMapLevel3>(tables, t4, status);
}

x64::PageMapLevel2 *Pager::getPageMap2(const MaybeIdentityMapped& tables, x64::PageMapLevel3 *l3, uint16_t pdpte, IFrameSource& frames, OsStatus *status) {
    x64::pdpte& t3 = l3->entries[pdpte];
    if (!t3.present()) {
        return AllocateTable<x64::PageMapLevel2>(tables, t3, frames, status);
    }

    if (t3.is1g()) {
        *status = OsStatusInvalidData;
        return nullptr;
    }

    return FindTable<x64::PageMapLevel2>(tables, t3, status);
}

OsStatus Pager::mapLargePage(const MaybeIdentityMapped& tables, x64::PageMapLevel4 *l4, VirtualAddress vaddr, PhysicalAddress paddr, IFrameSource& frames) {
    auto [pml4e, pdpte, pdte, _] = x64::GetAddressParts(vaddr.toInteger());
    OsStatus status = OsStatusSuccess;

    x64::PageMapLevel3 *l3 = getPageMap3(tables, l4, pml4e, frames, &status);
    if (l3 == nullptr) {
        return status;
    }

    x64::PageMapLevel2 *l2 = getPageMap2(tables, l3, pdpte, frames, &status);
    if (l2 == nullptr) {
        return status;
    }

    x64::pdte& t2 = l2->entries[pdte];
    if (t2.present()) {
        return OsStatusAlreadyExists;
    }

    x64::pdte entry { };
    entry.setAddress(paddr.toInteger());
    entry.setPresent(true);
    entry.setWriteable(true);
    entry.setGlobal(true);
    entry.set2m(true);

    t2 = entry;

    return OsStatusSuccess;
}

OsStatus Pager::mapPhysicalMemory(PhysicalMemoryMap& map, size_t memSize, size_t identityMappedSize, IFrameSource& frames, size_t *mapped) {
    *mapped = 0;

    if (memSize > map.maxSize()) {
        MemLog.warnf("Physical memory size ", Hex(memSize), " exceeds the memory map size ", Hex(map.maxSize()));
        return OsStatusInvalidInput;
    }

    MaybeIdentityMapped tables { map, identityMappedSize };

    x64::PageMapLevel4 *l4 = tables.table<x64::PageMapLevel4>(mRoot);
    if (l4 == nullptr) {
        MemLog.warnf("Root page table ", mRoot, " is not accessible.");
        return OsStatusInvalidAddress;
    }

    size_t pages = LargePages(memSize);
    MemLog.dbgf("Mapping ", Hex(memSize), " bytes of physical memory at ", map.base(), " in ", pages, " 2m pages");

    for (size_t page = 0; page < pages; page++) {
        uintptr_t front = page * x64::kLargePageSize;

        // both are within the memory map, which is checked above
        PhysicalAddress paddr = *PhysicalAddress::fromInteger(front);
        VirtualAddress vaddr = *map.base().offset(front);

        if (front % kGigabyte == 0) {
            MemLog.dbgf("Mapping ", paddr, " to ", vaddr);
        }

        if (OsStatus status = mapLargePage(tables, l4, vaddr, paddr, frames)) {
            MemLog.warnf("Failed to map ", paddr, " to ", vaddr, ": ", OsStatusId(status));
            return status;
        }

        __invlpg(vaddr.toInteger());

        *mapped = front + x64::kLargePageSize;
        map.extend(*mapped);
    }

    return OsStatusSuccess;
}

OsStatus Pager::mapPhysicalMemory(size_t memSize, size_t identityMappedSize, IFrameSource& frames, size_t *mapped) {
    return mapPhysicalMemory(GetPhysicalMemoryMap(), memSize, identityMappedSize, frames, mapped);
}

std::optional<PhysicalAddress> Pager::translate(const MaybeIdentityMapped& tables, VirtualAddress vaddr) const {
    auto [pml4e, pdpte, pdte, pte] = x64::GetAddressParts(vaddr.toInteger());
    uintptr_t address = vaddr.toInteger();
    OsStatus status = OsStatusSuccess;

    const x64::PageMapLevel4 *l4 = tables.table<x64::PageMapLevel4>(mRoot);
    if (l4 == nullptr) {
        return std::nullopt;
    }

    const x64::pml4e& t4 = l4->entries[pml4e];
    if (!t4.present()) {
        return std::nullopt;
    }

    const x64::PageMapLevel3 *l3 = FindTable<x64::PageMapLevel3>(tables, t4, &status);
    if (l3 == nullptr) {
        return std::nullopt;
    }

    const x64::pdpte& t3 = l3->entries[pdpte];
    if (!t3.present()) {
        return std::nullopt;
    }

    if (t3.is1g()) {
        return PhysicalAddress::fromInteger((t3.address() & ~(x64::kHugePageSize - 1)) | (address & (x64::kHugePageSize - 1)));
    }

    const x64::PageMapLevel2 *l2 = FindTable<x64::PageMapLevel2>(tables, t3, &status);
    if (l2 == nullptr) {
        return std::nullopt;
    }

    const x64::pdte& t2 = l2->entries[pdte];
    if (!t2.present()) {
        return std::nullopt;
    }

    if (t2.is2m()) {
        return PhysicalAddress::fromInteger((t2.address() & ~(x64::kLargePageSize - 1)) | (address & (x64::kLargePageSize - 1)));
    }

    const x64::PageTable *l1 = FindTable<x64::PageTable>(tables, t2, &status);
    if (l1 == nullptr) {
        return std::nullopt;
    }

    const x64::pte& t1 = l1->entries[pte];
    if (!t1.present()) {
        return std::nullopt;
    }

    return PhysicalAddress::fromInteger(t1.address() | (address & (x64::kPageSize - 1)));
}
