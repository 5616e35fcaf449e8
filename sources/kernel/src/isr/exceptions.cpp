#include "isr/exceptions.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

OsStatus kr::ExceptionTable::install(IsrTable& table) const {
    for (size_t i = 0; i < isr::kExceptionCount; i++) {
        Vector vector = uint8_t(i);
        IsrHandler handler = mHandlers[i];
        if (handler == nullptr) {
            continue;
        }

        if (OsStatus status = table.install(vector, GetVectorInfo(vector), handler)) {
            IsrLog.errorf("Failed to install handler for ", vector, ": ", OsStatusId(status));
            return status;
        }
    }

    return OsStatusSuccess;
}

void kr::DoubleFaultHandler(InterruptFrame *frame, Vector, uint64_t error) {
    IsrLog.fatalf("*** DOUBLE FAULT ***");
    IsrLog.fatalf("| Error code | ", Hex(error).pad(16, '0'));
    IsrLog.fatalf(*frame);

    KR_PANIC("Double fault");
}

kr::ExceptionTable kr::GetDefaultExceptionTable() {
    ExceptionTable exceptions;

    OsStatus status = exceptions.set(isr::DF, DoubleFaultHandler);
    KR_ASSERT(status == OsStatusSuccess);

    return exceptions;
}
