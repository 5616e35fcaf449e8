#pragma once

#include "common/address.hpp"

#include <cstddef>
#include <cstdint>

namespace sm {
    namespace detail {
        struct VirtualAddressSpace {
            using Storage = uintptr_t;

            static constexpr bool kIsVirtual = true;

            /// @brief Number of implemented virtual address bits with 4 level paging.
            static constexpr unsigned kWidth = 48;

            /// @brief Test if an address is canonical.
            ///
            /// Bits 63 through 47 must all be copies of bit 47.
            static constexpr bool isValid(Storage value) noexcept {
                Storage high = value >> (kWidth - 1);
                return high == 0 || high == (Storage(1) << (64 - (kWidth - 1))) - 1;
            }
        };
    }

    using VirtualAddress = sm::Address<detail::VirtualAddressSpace>;
}
