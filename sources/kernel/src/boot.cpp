#include "boot.hpp"

#include "logger/categories.hpp"

uintptr_t kr::MemoryRegion::back() const {
    uintptr_t result;
    if (__builtin_add_overflow(front.toInteger(), size, &result)) {
        return UINTPTR_MAX;
    }

    return result;
}

size_t kr::GetPhysicalMemorySize(std::span<const MemoryRegion> regions) {
    size_t size = 0;
    for (const MemoryRegion& region : regions) {
        if (region.kind == MemoryRegionKind::eMmio) {
            continue;
        }

        size = std::max(size, region.back());
    }

    return size;
}

void kr::Format<kr::MemoryRegionKind>::format(kr::IOutStream& out, kr::MemoryRegionKind value) {
    switch (value) {
    case MemoryRegionKind::eUsed:
        out.write("Used");
        break;
    case MemoryRegionKind::eFree:
        out.write("Free");
        break;
    case MemoryRegionKind::eAcpi:
        out.write("ACPI");
        break;
    case MemoryRegionKind::eMmio:
        out.write("MMIO");
        break;
    default:
        out.write("Unknown (");
        out.write(kr::Hex(std::to_underlying(value)));
        out.write(")");
        break;
    }
}

static std::optional<kr::MemoryRegionKind> DecodeKind(uint64_t size) {
    switch (size & boot::kMMapTypeMask) {
    case boot::eMMapUsed: return kr::MemoryRegionKind::eUsed;
    case boot::eMMapFree: return kr::MemoryRegionKind::eFree;
    case boot::eMMapAcpi: return kr::MemoryRegionKind::eAcpi;
    case boot::eMMapMmio: return kr::MemoryRegionKind::eMmio;
    default: return std::nullopt;
    }
}

OsStatus boot::DecodeMemoryEntry(MMapEnt entry, kr::MemoryRegion *region) {
    std::optional<kr::MemoryRegionKind> kind = DecodeKind(entry.size);
    if (!kind.has_value()) {
        return OsStatusInvalidData;
    }

    std::optional<kr::PhysicalAddress> front = kr::PhysicalAddress::fromInteger(entry.ptr);
    if (!front.has_value()) {
        return OsStatusInvalidAddress;
    }

    *region = kr::MemoryRegion {
        .front = *front,
        .size = entry.size & ~kMMapTypeMask,
        .kind = *kind,
    };

    return OsStatusSuccess;
}

OsStatus boot::DecodeMemoryMap(std::span<const MMapEnt> entries, std::span<kr::MemoryRegion> regions, size_t *count) {
    size_t limit = std::min(entries.size(), regions.size());

    size_t decoded = 0;
    while (decoded < limit) {
        const MMapEnt& entry = entries[decoded];
        if (OsStatus status = DecodeMemoryEntry(entry, &regions[decoded])) {
            BootLog.warnf("Invalid memory map entry ", decoded, ": ", kr::Hex(entry.ptr).pad(16, '0'), " ", kr::Hex(entry.size), " ", OsStatusId(status));
            *count = decoded;
            return status;
        }

        decoded += 1;
    }

    *count = decoded;

    if (decoded < entries.size()) {
        BootLog.warnf("Memory map truncated to ", decoded, " of ", entries.size(), " entries.");
        return OsStatusOutOfMemory;
    }

    return OsStatusSuccess;
}
