#pragma once

#include "std/traits.hpp"
#include "std/string_view.hpp"

#include <algorithm>

namespace stdx {
    /// @brief A fixed capacity string stored inline.
    ///
    /// Writes past the capacity are truncated, this type never allocates
    /// and is safe to use from interrupt handlers.
    template<typename T, size_t N>
    class StaticStringBase {
        using SizeType = detail::ArraySize<N>;

        SizeType mSize;
        T mStorage[N];

    public:
        constexpr StaticStringBase()
            : mSize(0)
            , mStorage()
        { }

        template<size_t S> requires (S <= N + 1)
        constexpr StaticStringBase(const T (&str)[S])
            : StaticStringBase(str, str + S - 1)
        { }

        template<typename R> requires IsRange<const T, R>
        constexpr StaticStringBase(const R& range)
            : StaticStringBase(std::begin(range), std::end(range))
        { }

        constexpr StaticStringBase(StringViewBase<T> view)
            : StaticStringBase(view.begin(), view.end())
        { }

        constexpr StaticStringBase(const T *front, const T *back)
            : mSize(0)
            , mStorage()
        {
            add(front, back);
        }

        constexpr size_t count() const { return mSize; }
        constexpr size_t capacity() const { return N; }

        constexpr bool isEmpty() const { return mSize == 0; }
        constexpr bool isFull() const { return mSize == N; }

        constexpr T *begin() { return mStorage; }
        constexpr T *end() { return mStorage + mSize; }

        constexpr const T *begin() const { return mStorage; }
        constexpr const T *end() const { return mStorage + mSize; }

        constexpr void clear() {
            mSize = 0;
        }

        constexpr void add(T elem) {
            if (mSize < N) {
                mStorage[mSize++] = elem;
            }
        }

        constexpr void add(StringViewBase<T> view) {
            add(view.begin(), view.end());
        }

        constexpr void add(const T *front, const T *back) {
            size_t size = std::min<size_t>(back - front, N - mSize);
            std::copy_n(front, size, mStorage + mSize);
            mSize += size;
        }

        constexpr const T& operator[](size_t index) const {
            return mStorage[index];
        }

        constexpr operator std::basic_string_view<T>() const {
            return std::basic_string_view<T>(begin(), mSize);
        }
    };

    template<size_t N>
    using StaticString = StaticStringBase<char, N>;

    static_assert(sizeof(StaticString<16>) == 17);
    static_assert(sizeof(StaticString<64>) == 65);
}
