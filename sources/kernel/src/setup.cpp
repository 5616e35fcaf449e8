#include "setup.hpp"

#include "arch/intrin.hpp"
#include "logger/categories.hpp"

static constinit kr::ArchSetup gArchSetup{};

OsStatus kr::ArchSetup::setupInterrupts(const ArchTables& tables) {
    if (OsStatus status = ValidateVectorTable()) {
        return status;
    }

    //
    // The double fault handler must be in place before the table is active,
    // a fault while delivering an exception would otherwise triple fault.
    //
    DisableInterrupts();

    ExceptionTable exceptions = GetDefaultExceptionTable();
    if (OsStatus status = exceptions.install(*tables.isrTable)) {
        return status;
    }

    for (size_t i = 0; i < isr::kIsrCount; i++) {
        Vector vector = uint8_t(i);
        tables.idt->install(vector, GetIsrStub(vector));
    }

    tables.idt->activate();

    IDTR idtr = tables.idt->idtr();
    InitLog.dbgf("IDT active at ", Hex(idtr.base).pad(16, '0'), " limit ", Hex(idtr.limit));

    return OsStatusSuccess;
}

OsStatus kr::ArchSetup::verifyMapping(const Pager& pager, const ArchTables& tables, const ArchSetupParams& params, size_t mapped) {
    if (mapped == 0) {
        return OsStatusSuccess;
    }

    MaybeIdentityMapped lookup { *tables.memoryMap, params.identityMappedSize };
    VirtualAddress last = *tables.memoryMap->base().offset(mapped - 1);

    std::optional<PhysicalAddress> paddr = pager.translate(lookup, last);
    if (!paddr.has_value() || paddr->toInteger() != mapped - 1) {
        InitLog.errorf("Physical memory map does not reach ", Hex(mapped - 1), " at ", last);
        return OsStatusInvalidData;
    }

    return OsStatusSuccess;
}

OsStatus kr::ArchSetup::finish(OsStatus status) {
    mStatus = status;
    mComplete.store(status == OsStatusSuccess, std::memory_order_release);
    mFinished.store(true, std::memory_order_release);
    return status;
}

OsStatus kr::ArchSetup::setup(const ArchTables& tables, const ArchSetupParams& params, size_t *mapped) {
    *mapped = 0;

    if (mStarted.test_and_set(std::memory_order_acq_rel)) {
        while (!mFinished.load(std::memory_order_acquire)) {
            arch::Intrin::pause();
        }

        InitLog.dbgf("Architecture already set up: ", OsStatusId(mStatus));
        return mStatus;
    }

    if (OsStatus status = setupInterrupts(tables)) {
        InitLog.errorf("Failed to set up interrupts: ", OsStatusId(status));
        return finish(status);
    }

    Pager pager = Pager::current();
    InitLog.dbgf("Page tables at ", pager.root(), ", identity mapped ", Hex(params.identityMappedSize));

    OsStatus status = pager.mapPhysicalMemory(*tables.memoryMap, params.memSize, params.identityMappedSize, *params.frames, mapped);
    if (status != OsStatusSuccess) {
        InitLog.errorf("Failed to map physical memory: ", OsStatusId(status), ", mapped ", Hex(*mapped), " of ", Hex(params.memSize));
        return finish(status);
    }

    if (OsStatus status = verifyMapping(pager, tables, params, *mapped)) {
        return finish(status);
    }

    InitLog.infof("Mapped ", Hex(*mapped), " bytes of physical memory at ", tables.memoryMap->base());

    return finish(OsStatusSuccess);
}

OsStatus kr::SetupArch(const ArchSetupParams& params, size_t *mapped) {
    ArchTables tables = {
        .isrTable = &GetIsrTable(),
        .idt = &GetInterruptDescriptorTable(),
        .memoryMap = &GetPhysicalMemoryMap(),
    };

    return gArchSetup.setup(tables, params, mapped);
}
