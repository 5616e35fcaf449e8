#include "isr/isr.hpp"
#include "isr/error_code.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

static constinit kr::IsrTable gIsrTable{};

OsStatus kr::IsrTable::install(Vector vector, VectorInfo info, IsrHandler handler, IsrHandler *previous) {
    if (handler == nullptr) {
        return OsStatusInvalidInput;
    }

    VectorInfo expected = GetVectorInfo(vector);
    if (info != expected) {
        IsrLog.warnf("Refusing handler for ", vector, ", expected error code size ", expected.errorCodeSize, " and must not return ", expected.mustNotReturn);
        return OsStatusInvalidInput;
    }

    IsrHandler old = mHandlers[vector.value()].exchange(handler, std::memory_order_acq_rel);
    if (previous != nullptr) {
        *previous = old;
    }

    return OsStatusSuccess;
}

kr::IsrHandler kr::IsrTable::remove(Vector vector) {
    return mHandlers[vector.value()].exchange(nullptr, std::memory_order_acq_rel);
}

kr::IsrHandler kr::IsrTable::get(Vector vector) const {
    return mHandlers[vector.value()].load(std::memory_order_acquire);
}

kr::IsrTable& kr::GetIsrTable() {
    return gIsrTable;
}

static void LogErrorCode(const kr::ExceptionInfo& info, uint64_t error) {
    using kr::ErrorCodeShape;

    switch (info.errorCode) {
    case ErrorCodeShape::eNone:
        break;
    case ErrorCodeShape::eZero:
        if (error != 0) {
            IsrLog.errorf("| Unexpected | Error code should be zero");
        }
        break;
    case ErrorCodeShape::eSelector:
        if (std::optional<kr::SelectorErrorCode> selector = kr::SelectorErrorCode::of(error)) {
            IsrLog.errorf("| Selector   | ", *selector);
        }
        break;
    case ErrorCodeShape::ePageFault:
        IsrLog.errorf("| Page fault | ", kr::PageFaultErrorCode(error));
        IsrLog.errorf("| CR2        | ", kr::Hex(__get_cr2()).pad(16, '0'));
        break;
    case ErrorCodeShape::eControlProtection:
        IsrLog.errorf("| Cause      | ", kr::ControlProtectionErrorCode(error));
        break;
    case ErrorCodeShape::eVmExit:
        IsrLog.errorf("| Exit       | ", kr::VmExitCode(error));
        break;
    case ErrorCodeShape::eSecurity:
        IsrLog.errorf("| Cause      | ", kr::SecurityErrorCode(error));
        break;
    }
}

void kr::DefaultIsrHandler(InterruptFrame *frame, Vector vector, uint64_t error) {
    if (vector.isUserInterrupt()) {
        IsrLog.warnf("Unhandled interrupt ", vector, " at ", Hex(frame->rip).pad(16, '0'), ", dismissed.");
        return;
    }

    const ExceptionInfo& info = GetExceptionInfo(vector);

    IsrLog.errorf("Unhandled exception ", vector, " ", info.name, " (", info.kind, ")");
    IsrLog.errorf("| Error code | ", Hex(error).pad(16, '0'));
    LogErrorCode(info, error);
    IsrLog.errorf(*frame);

    if (vector == isr::NP) {
        if (std::optional<SelectorErrorCode> selector = SelectorErrorCode::of(error)) {
            auto message = kr::concat<kLogMessageSize>("Segment not present, ", selector->table(), " index ", selector->index());
            KR_PANIC(message);
        }
    }

    auto message = kr::concat<kLogMessageSize>("No handler for ", info.mnemonic, " ", info.name);
    KR_PANIC(message);
}

void kr::DispatchInterrupt(const IsrTable& table, InterruptFrame *frame, Vector vector, uint64_t error) {
    IsrHandler handler = table.get(vector);
    if (handler == nullptr) {
        handler = DefaultIsrHandler;
    }

    handler(frame, vector, error);

    //
    // Returning from an abort resumes at an undefined instruction.
    //
    if (GetVectorInfo(vector).mustNotReturn) {
        auto message = kr::concat<kLogMessageSize>("Handler for ", vector, " returned");
        KR_PANIC(message);
    }
}

OsStatus kr::InstallIsr(Vector vector, IsrHandler handler) {
    if (!vector.isUserInterrupt()) {
        IsrLog.warnf("Refusing to install user handler for exception ", vector);
        return OsStatusInvalidInput;
    }

    if (OsStatus status = GetIsrTable().install(vector, GetVectorInfo(vector), handler)) {
        return status;
    }

    GetInterruptDescriptorTable().install(vector, GetIsrStub(vector));
    return OsStatusSuccess;
}

uintptr_t kr::GetIsrStub(Vector vector) {
    return (uintptr_t)KrIsrTable + (vector.value() * kIsrStubStride);
}

void kr::DisableInterrupts() {
    __cli();
}

void kr::Format<kr::InterruptFrame>::format(kr::IOutStream& out, const kr::InterruptFrame& value) {
    out.format("RIP: ", Hex(value.rip).pad(16, '0'), " CS: ", Hex(value.cs).pad(4, '0'));
    out.format(" RFLAGS: ", Hex(value.rflags).pad(16, '0'));
    out.format(" RSP: ", Hex(value.rsp).pad(16, '0'), " SS: ", Hex(value.ss).pad(4, '0'));
}

extern "C" void KrIsrDispatchRoutine(kr::InterruptFrame *frame, uint8_t vector, uint64_t error) {
    kr::DispatchInterrupt(kr::GetIsrTable(), frame, vector, error);
}
