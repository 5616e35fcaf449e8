#pragma once

#include <bit>
#include <type_traits>

#include <stdint.h>

namespace x64 {
    /// @brief A 16 byte value that is always read and written with lock cmpxchg16b.
    ///
    /// std::atomic of a 16 byte type may fall back to a lock in libatomic, which
    /// is not available in the kernel and is not safe to use from an interrupt.
    template<typename T> requires (sizeof(T) == 16 && std::is_trivially_copyable_v<T>)
    class alignas(16) Atomic128 {
        struct Words {
            uint64_t low;
            uint64_t high;
        };

        // cmpxchg16b writes to its operand even when only used to load
        mutable Words mStorage;

        [[gnu::always_inline]]
        Words compareExchange(Words expected, Words desired) const noexcept {
            asm volatile(
                "lock cmpxchg16b %[storage]"
                : [storage] "+m"(mStorage), "+a"(expected.low), "+d"(expected.high)
                : "b"(desired.low), "c"(desired.high)
                : "cc", "memory"
            );

            return expected;
        }

    public:
        constexpr Atomic128() noexcept
            : mStorage { 0, 0 }
        { }

        constexpr Atomic128(T value) noexcept
            : mStorage(std::bit_cast<Words>(value))
        { }

        T load() const noexcept {
            //
            // Compare against zero and write back zero, either the value was zero and
            // nothing changes or the compare fails and the current value is returned.
            //
            return std::bit_cast<T>(compareExchange(Words { 0, 0 }, Words { 0, 0 }));
        }

        T exchange(T value) noexcept {
            Words desired = std::bit_cast<Words>(value);
            Words expected = compareExchange(Words { 0, 0 }, Words { 0, 0 });

            while (true) {
                Words current = compareExchange(expected, desired);
                if (current.low == expected.low && current.high == expected.high) {
                    return std::bit_cast<T>(current);
                }

                expected = current;
            }
        }

        void store(T value) noexcept {
            (void)exchange(value);
        }
    };
}
