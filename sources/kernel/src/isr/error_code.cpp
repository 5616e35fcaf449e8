#include "isr/error_code.hpp"

using namespace stdx::literals;

void kr::Format<kr::DescriptorTable>::format(kr::IOutStream& out, kr::DescriptorTable value) {
    switch (value) {
    case DescriptorTable::eGdt:
        out.write("GDT");
        break;
    case DescriptorTable::eIdt:
        out.write("IDT");
        break;
    case DescriptorTable::eLdt:
        out.write("LDT");
        break;
    default:
        out.write(kr::Hex(std::to_underlying(value)));
        break;
    }
}

void kr::Format<kr::SelectorErrorCode>::format(kr::IOutStream& out, kr::SelectorErrorCode value) {
    out.format(value.table(), "[", value.index(), "]");

    if (value.external()) {
        out.write(" (External)");
    }
}

void kr::Format<kr::PageFaultErrorCode>::format(kr::IOutStream& out, kr::PageFaultErrorCode value) {
    using Bit = kr::PageFaultErrorCode::Bit;

    out.write(value.test(Bit::ePresent) ? "Protection violation"_sv : "Not present"_sv);
    out.write(value.test(Bit::eWrite) ? ", Write"_sv : ", Read"_sv);
    out.write(value.test(Bit::eUser) ? ", User"_sv : ", Supervisor"_sv);

    if (value.test(Bit::eReserved)) out.write(", Reserved bit set");
    if (value.test(Bit::eFetch)) out.write(", Instruction fetch");
    if (value.test(Bit::eProtectionKey)) out.write(", Protection key");
    if (value.test(Bit::eShadowStack)) out.write(", Shadow stack");
    if (value.test(Bit::eSgx)) out.write(", SGX");
}

void kr::Format<kr::ControlProtectionErrorCode>::format(kr::IOutStream& out, kr::ControlProtectionErrorCode value) {
    using Cause = kr::ControlProtectionErrorCode::Cause;

    switch (value.cause()) {
    case Cause::eNearRet:
        out.write("NEAR-RET");
        break;
    case Cause::eFarRet:
        out.write("FAR-RET/IRET");
        break;
    case Cause::eEndBranch:
        out.write("ENDBRANCH");
        break;
    case Cause::eRstorSsp:
        out.write("RSTORSSP");
        break;
    case Cause::eSetSsBsy:
        out.write("SETSSBSY");
        break;
    default:
        out.format("Unknown (", kr::Hex(value.value()), ")");
        break;
    }

    if (value.enclave()) {
        out.write(" (Enclave)");
    }
}

void kr::Format<kr::VmExitCode>::format(kr::IOutStream& out, kr::VmExitCode value) {
    using Exit = kr::VmExitCode::Exit;

    switch (value.exit()) {
    case Exit::eWriteDr7: out.write("DR7 write"); break;
    case Exit::eRdtsc: out.write("RDTSC"); break;
    case Exit::eRdpmc: out.write("RDPMC"); break;
    case Exit::eCpuid: out.write("CPUID"); break;
    case Exit::eIoio: out.write("IOIO"); break;
    case Exit::eMsr: out.write("MSR"); break;
    case Exit::eVmmcall: out.write("VMMCALL"); break;
    case Exit::eRdtscp: out.write("RDTSCP"); break;
    case Exit::eWbinvd: out.write("WBINVD"); break;
    case Exit::eMonitor: out.write("MONITOR"); break;
    case Exit::eMwait: out.write("MWAIT"); break;
    case Exit::eNestedPageFault: out.write("Nested page fault"); break;
    default:
        out.format("Exit code ", kr::Hex(value.value()));
        break;
    }
}

void kr::Format<kr::SecurityErrorCode>::format(kr::IOutStream& out, kr::SecurityErrorCode value) {
    if (value.isInitRedirection()) {
        out.write("INIT redirection");
    } else {
        out.format("Security event ", kr::Hex(value.value()));
    }
}
