#pragma once

#include "common/address.hpp"

#include <cstddef>
#include <cstdint>

namespace sm {
    namespace detail {
        struct PhysicalAddressSpace {
            using Storage = uintptr_t;

            static constexpr bool kIsVirtual = false;

            /// @brief Architectural limit of physical addresses on x86_64.
            static constexpr unsigned kWidth = 52;

            static constexpr bool isValid(Storage value) noexcept {
                return value < (Storage(1) << kWidth);
            }
        };
    }

    using PhysicalAddress = sm::Address<detail::PhysicalAddressSpace>;
}
