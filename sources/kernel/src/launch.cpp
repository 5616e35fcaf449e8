#include "boot.hpp"
#include "setup.hpp"

#include "logger/categories.hpp"
#include "logger/e9_appender.hpp"
#include "panic.hpp"

/// @brief Page tables are never taken from the first 1M, firmware and the bootloader live there.
static constexpr uintptr_t kLowMemorySize = 0x10'0000;

static constexpr size_t kMaxMemoryRegions = 256;

static constinit kr::E9Appender gDebugAppender{};
static constinit kr::MemoryRegion gMemoryRegions[kMaxMemoryRegions]{};

static std::span<const kr::MemoryRegion> DecodeMemoryMap(std::span<const boot::MMapEnt> mmap) {
    size_t count = 0;
    OsStatus status = boot::DecodeMemoryMap(mmap, gMemoryRegions, &count);

    BootLog.infof("| Front              | Size               | Kind");
    BootLog.infof("|--------------------+--------------------+-----");
    for (size_t i = 0; i < count; i++) {
        const kr::MemoryRegion& region = gMemoryRegions[i];
        BootLog.infof("| ", region.front, " | ", kr::Hex(region.size).pad(16, '0'), " | ", region.kind);
    }

    //
    // A partial map would leave memory unmapped and its frames unused,
    // setup cannot recover from that.
    //
    if (status != OsStatusSuccess) {
        BootLog.fatalf("Memory map decoding stopped after ", count, " of ", mmap.size(), " entries: ", OsStatusId(status));
        KR_PANIC("Failed to decode the memory map.");
    }

    return std::span(gMemoryRegions, count);
}

extern "C" [[noreturn]] void KrLaunch(const boot::MMapEnt *mmap, size_t count) {
    if (kr::E9Appender::isAvailable()) {
        OsStatus status = kr::LogQueue::addGlobalAppender(&gDebugAppender);
        KR_CHECK(status == OsStatusSuccess, "Failed to add the debug port appender.");
    }

    std::span<const kr::MemoryRegion> regions = DecodeMemoryMap(std::span(mmap, count));

    kr::FreeFrameSequence frames { regions, x64::kPageSize, kLowMemorySize };

    kr::ArchSetupParams params = {
        .memSize = kr::GetPhysicalMemorySize(regions),
        .identityMappedSize = boot::kBootbootIdentityMappedSize,
        .frames = &frames,
    };

    size_t mapped = 0;
    if (OsStatus status = kr::SetupArch(params, &mapped)) {
        InitLog.fatalf("Architecture setup failed: ", OsStatusId(status));
        KR_PANIC("Failed to set up the architecture.");
    }

    InitLog.infof("Setup complete.");
    KrHalt();
}
