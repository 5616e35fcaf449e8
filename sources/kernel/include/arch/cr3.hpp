#pragma once

#include "arch/intrin.hpp"
#include "arch/paging.hpp"
#include "util/format.hpp"

#include <stdint.h>

namespace x64 {
    using cr3_t = uintptr_t;

    using pcid_t = uint16_t;

    class Cr3 {
        cr3_t mValue;

        constexpr Cr3(cr3_t value) : mValue(value) { }

    public:
        constexpr Cr3() : Cr3(0) { }

        enum Bit : cr3_t {
            ePcidMask = (0xFFF),

            eAddressMask = paging::kAddressMask,

            PWT = (1ull << 3),
            PCD = (1ull << 4),
        };

        constexpr cr3_t value() const { return mValue; }

        constexpr static Cr3 of(cr3_t value) {
            return Cr3(value);
        }

        constexpr bool test(Bit flag) const {
            return mValue & flag;
        }

        constexpr pcid_t pcid() const {
            return mValue & ePcidMask;
        }

        /// @brief Physical address of the top level page table.
        constexpr uintptr_t address() const {
            return mValue & eAddressMask;
        }

        [[gnu::always_inline, nodiscard]]
        static Cr3 load() {
            return Cr3(__get_cr3());
        }
    };
}

template<>
struct kr::Format<x64::Cr3> {
    static void format(kr::IOutStream& out, x64::Cr3 value);
};
