#include "arch/cr3.hpp"

using Cr3Format = kr::Format<x64::Cr3>;

void Cr3Format::format(kr::IOutStream& out, x64::Cr3 value) {
    out.format(kr::Hex(value.address()).pad(16, '0'));

    // without CR4.PCIDE these bits are the cache flags, with it they are the PCID
    if (value.test(x64::Cr3::PWT)) {
        out.write(" PWT");
    }

    if (value.test(x64::Cr3::PCD)) {
        out.write(" PCD");
    }

    if (value.pcid() != 0) {
        out.format(" (PCID ", kr::Hex(value.pcid()).pad(3, '0'), ")");
    }
}
