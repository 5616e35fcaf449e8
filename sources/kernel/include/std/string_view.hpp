#pragma once

#include "std/traits.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>

namespace stdx {
    /// @brief A non-owning view over a contiguous run of characters.
    ///
    /// Unlike a C string the view is not null terminated, string literals have
    /// their terminator stripped on construction.
    template<typename T>
    class StringViewBase {
        const T *mFront;
        const T *mBack;

    public:
        constexpr StringViewBase()
            : mFront(nullptr)
            , mBack(nullptr)
        { }

        constexpr StringViewBase(const T *front, const T *back)
            : mFront(front)
            , mBack(back)
        { }

        template<size_t N>
        constexpr StringViewBase(const T (&str)[N])
            : StringViewBase(str, str + N - 1)
        { }

        template<typename R> requires IsRange<const T, R>
        constexpr StringViewBase(const R& range)
            : StringViewBase(std::begin(range), std::end(range))
        { }

        constexpr StringViewBase(std::basic_string_view<T> view)
            : StringViewBase(view.data(), view.data() + view.size())
        { }

        constexpr size_t count() const { return mBack - mFront; }
        constexpr size_t sizeInBytes() const { return count() * sizeof(T); }
        constexpr bool isEmpty() const { return mFront == mBack; }

        constexpr const T *data() const { return mFront; }
        constexpr const T *begin() const { return mFront; }
        constexpr const T *end() const { return mBack; }

        constexpr const T& operator[](size_t index) const { return mFront[index]; }

        constexpr operator std::basic_string_view<T>() const {
            return std::basic_string_view<T>(mFront, count());
        }

        constexpr bool operator==(const StringViewBase& other) const {
            return std::equal(begin(), end(), other.begin(), other.end());
        }
    };

    using StringView = StringViewBase<char>;

    namespace literals {
        constexpr StringView operator""_sv(const char *str, size_t length) {
            return StringView(str, str + length);
        }
    }
}
