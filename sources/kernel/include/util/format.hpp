#pragma once

#include <kestrel/status.h>

#include "std/string_view.hpp"
#include "std/static_string.hpp"
#include "std/traits.hpp"

#include <algorithm>
#include <span>
#include <utility>

namespace kr {
    template<typename T>
    struct Format;

    template<typename T>
    concept IsFormatSize = requires {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
    };

    template<typename T>
    concept IsFormat = IsFormatSize<T> && requires(T it) {
        { Format<T>::toString(std::declval<char*>(), it) } -> std::same_as<stdx::StringView>;
    };

    /// @brief Does a type conform to the static format concept.
    /// @warning The returned object is allowed to own its storage, always assign it
    ///          to auto in cases where its a StaticString or similar.
    template<typename T>
    concept IsFormatEx = requires(T it) {
        { Format<T>::toString(it) } -> std::convertible_to<stdx::StringView>;
    };

    template<typename T>
    concept IsStreamFormat = requires(T it) {
        { Format<T>::format(std::declval<class IOutStream&>(), it) };
    };

    class IOutStream {
    public:
        virtual ~IOutStream() = default;

        virtual void write(stdx::StringView message) = 0;

        virtual void write(char c) {
            write(stdx::StringView(&c, &c + 1));
        }

        template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
        void write(const T& value);

        template<typename... T>
        void format(T&&... args) {
            (write(std::forward<T>(args)), ...);
        }
    };

    template<std::integral T>
    struct Int {
        T value;
        int width = 0;
        char fill = '\0';

        Int(T value) noexcept : value(value) {}

        Int pad(size_t width, char fill = '0') const {
            Int copy = *this;
            copy.width = width;
            copy.fill = fill;
            return copy;
        }
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '\0';
        bool prefix = true;

        Hex(T value) noexcept : value(value) {}

        Hex pad(size_t width, char fill = '0', bool prefix = true) const {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            copy.prefix = prefix;
            return copy;
        }
    };

    template<std::integral T>
    stdx::StringView FormatInt(std::span<char> buffer, T input, int base, int width = 0, char fill = '\0') {
        static constexpr char kHex[] = "0123456789ABCDEF";
        bool negative = input < 0;

        char *end = buffer.data() + buffer.size();
        char *ptr = end - 1;
        if (input != 0) {
            stdx::Unsigned<T> value = negative ? stdx::Unsigned<T>(0) - stdx::Unsigned<T>(input) : stdx::Unsigned<T>(input);

            while (value != 0) {
                *ptr-- = kHex[value % base];
                value /= base;
            }
        } else {
            *ptr-- = '0';
        }

        if (fill != '\0') {
            if (negative) {
                width--;
            }

            int remaining = width - (end - ptr) + 1;
            while (remaining-- > 0 && ptr >= buffer.data()) {
                *ptr-- = fill;
            }
        }

        if (negative) {
            *ptr-- = '-';
        }

        return stdx::StringView(ptr + 1, end);
    }

    constexpr stdx::StringView present(bool present) {
        using namespace stdx::literals;
        return present ? "Present"_sv : "Not Present"_sv;
    }

    template<>
    struct Format<char> {
        static constexpr size_t kStringSize = 1;
        static constexpr stdx::StringView toString(char *buffer, char value) {
            buffer[0] = value;
            return stdx::StringView(buffer, buffer + 1);
        }
    };

    template<std::integral T>
    struct Format<T> {
        // sign and digits
        static constexpr size_t kStringSize = stdx::NumericTraits<T>::kMaxDigits10 + 1;
        static constexpr stdx::StringView toString(char *buffer, T value) {
            return FormatInt(std::span(buffer, kStringSize), value, 10);
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kDigits = stdx::NumericTraits<T>::kMaxDigits2;
        static constexpr size_t kStringSize = kDigits + 2;

        static stdx::StringView toString(char *buffer, Hex<T> value) {
            char temp[kDigits + 1];
            stdx::StringView result = FormatInt(std::span(temp), stdx::Unsigned<T>(value.value), 16, std::min<int>(value.width, kDigits), value.fill);

            int offset = 0;
            if (value.prefix) {
                buffer[offset++] = '0';
                buffer[offset++] = 'x';
            }

            std::copy(result.begin(), result.end(), buffer + offset);
            return stdx::StringView(buffer, buffer + offset + result.count());
        }
    };

    template<std::integral T>
    struct Format<Int<T>> {
        static constexpr size_t kStringSize = stdx::NumericTraits<T>::kMaxDigits2 + 1;
        static stdx::StringView toString(char *buffer, Int<T> value) {
            return FormatInt(std::span(buffer, kStringSize), value.value, 10, std::min<int>(value.width, kStringSize - 1), value.fill);
        }
    };

    template<>
    struct Format<bool> {
        static stdx::StringView toString(bool value) {
            using namespace stdx::literals;
            return value ? "True"_sv : "False"_sv;
        }
    };

    template<IsFormatSize T>
    inline constexpr size_t kFormatSize = Format<T>::kStringSize;

    template<IsFormat T>
    inline constexpr stdx::StringView format(char *buffer, T value) {
        return Format<T>::toString(buffer, value);
    }

    template<IsFormat T>
    inline constexpr stdx::StaticString<kFormatSize<T>> format(T value) {
        char buffer[kFormatSize<T>];
        return stdx::StaticString<kFormatSize<T>>(format(buffer, value));
    }

    template<IsStreamFormat T>
    inline void format(IOutStream& out, const T& value) {
        Format<T>::format(out, value);
    }

    inline void format(IOutStream& out, stdx::StringView value) {
        out.write(value);
    }

    template<IsFormatEx T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        out.write(stdx::StringView(Format<T>::toString(value)));
    }

    template<IsFormat T> requires (!IsStreamFormat<T>)
    inline void format(IOutStream& out, const T& value) {
        char buffer[kFormatSize<T>];
        out.write(Format<T>::toString(buffer, value));
    }

    template<typename T> requires (!std::convertible_to<T, stdx::StringView>)
    void IOutStream::write(const T& value) {
        kr::format(*this, value);
    }

    /// @brief Format all arguments into a fixed size string.
    ///
    /// Output past @p N characters is truncated.
    template<size_t N, typename... T>
    inline stdx::StaticString<N> concat(T&&... args) noexcept {
        struct OutStream final : public IOutStream {
            stdx::StaticString<N> result;

            void write(stdx::StringView message) noexcept override {
                result.add(message);
            }
        };

        OutStream out;
        (out.format(args), ...);

        return out.result;
    }

    template<>
    struct Format<OsStatusId> {
        static void format(IOutStream& out, OsStatusId value);
    };
}
