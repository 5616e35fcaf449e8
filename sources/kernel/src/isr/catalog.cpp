#include "isr/catalog.hpp"

#include "logger/categories.hpp"

void kr::Format<kr::Vector>::format(kr::IOutStream& out, kr::Vector value) {
    out.write(kr::Hex(value.value()).pad(2, '0'));

    if (value.isException()) {
        out.format(" (", GetExceptionInfo(value).mnemonic, ")");
    }
}

void kr::Format<kr::ExceptionClass>::format(kr::IOutStream& out, kr::ExceptionClass value) {
    switch (value) {
    case ExceptionClass::eFault:
        out.write("Fault");
        break;
    case ExceptionClass::eTrap:
        out.write("Trap");
        break;
    case ExceptionClass::eFaultOrTrap:
        out.write("Fault or Trap");
        break;
    case ExceptionClass::eInterrupt:
        out.write("Interrupt");
        break;
    case ExceptionClass::eAbort:
        out.write("Abort");
        break;
    case ExceptionClass::eReserved:
        out.write("Reserved");
        break;
    default:
        out.write(kr::Hex(std::to_underlying(value)));
        break;
    }
}

OsStatus kr::ValidateVectorTable() {
    for (const ExceptionInfo& info : detail::kExceptionCatalog) {
        VectorInfo expected = GetCatalogVectorInfo(info);
        VectorInfo actual = GetVectorInfo(info.vector);

        if (expected != actual) {
            using namespace stdx::literals;

            IsrLog.errorf("Vector table mismatch for ", Vector(info.vector), " ", info.name);
            IsrLog.errorf("| Field            | Catalog | Table");
            IsrLog.errorf("| ---------------- | ------- | -----");
            IsrLog.errorf("| Error code size  | ", Int(expected.errorCodeSize).pad(7, ' '), " | ", actual.errorCodeSize);
            IsrLog.errorf("| Must not return  | ", expected.mustNotReturn ? "   True"_sv : "  False"_sv, " | ", actual.mustNotReturn);
            return OsStatusInvalidData;
        }
    }

    return OsStatusSuccess;
}
