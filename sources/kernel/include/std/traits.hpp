#pragma once

#include <concepts>
#include <iterator>
#include <type_traits>

#include <stdint.h>
#include <stddef.h>
#include <limits.h>

namespace stdx {
    template<std::integral T>
    using Signed = std::make_signed_t<T>;

    template<std::integral T>
    using Unsigned = std::make_unsigned_t<T>;

    template<std::integral T>
    struct NumericTraits {
        static constexpr int kMaxDigits2 = sizeof(T) * CHAR_BIT;
        static constexpr int kMaxDigits10 = sizeof(T) * 3;
        static constexpr int kMaxDigits16 = sizeof(T) * 2;
    };

    template<typename T, typename C>
    concept IsRange = requires(const C& range) {
        { std::begin(range) } -> std::convertible_to<T*>;
        { std::end(range) } -> std::convertible_to<T*>;
    };

    namespace detail {
        template<size_t N>
        struct ArraySizeType;

        template<size_t N> requires (N <= 0xFF)
        struct ArraySizeType<N> {
            using type = uint8_t;
        };

        template<size_t N> requires (N <= 0xFFFF && N > 0xFF)
        struct ArraySizeType<N> {
            using type = uint16_t;
        };

        template<size_t N> requires (N > 0xFFFF)
        struct ArraySizeType<N> {
            using type = uint32_t;
        };

        template<size_t N>
        using ArraySize = typename ArraySizeType<N>::type;
    }
}
