#pragma once

#include <concepts>
#include <cstddef>

namespace sm {
    template<std::integral T>
    constexpr T roundup(T value, T multiple) {
        return (value + multiple - 1) / multiple * multiple;
    }

    template<std::integral T>
    constexpr T rounddown(T value, T multiple) {
        return value / multiple * multiple;
    }
}

#define UTIL_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define UTIL_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;
