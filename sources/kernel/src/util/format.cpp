#include "util/format.hpp"

using OsStatusFormat = kr::Format<OsStatusId>;

void OsStatusFormat::format(IOutStream& out, OsStatusId value) {
    auto result = [&](stdx::StringView message) {
        out.format(message, " (", kr::Hex(OsStatus(value)).pad(8, '0'), ")");
    };

    switch (value) {
    case OsStatusSuccess:
        result("Success");
        break;
    case OsStatusOutOfMemory:
        result("Out of memory");
        break;
    case OsStatusNotFound:
        result("Not found");
        break;
    case OsStatusInvalidInput:
        result("Invalid input");
        break;
    case OsStatusNotSupported:
        result("Not supported");
        break;
    case OsStatusAlreadyExists:
        result("Already exists");
        break;
    case OsStatusInvalidData:
        result("Invalid data");
        break;
    case OsStatusInvalidAddress:
        result("Invalid address");
        break;
    case OsStatusDeviceBusy:
        result("Device busy");
        break;
    default:
        result("Unknown");
        break;
    }
}
