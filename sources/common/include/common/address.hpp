#pragma once

#include <bit>
#include <compare> // IWYU pragma: keep - std::strong_ordering
#include <memory> // IWYU pragma: keep - std::hash<>
#include <optional>

#include <cstddef>
#include <cstdint>

namespace sm {
    /// @brief An address in a given address space.
    ///
    /// Every constructed address is valid for its address space, the only way to
    /// create a non-null address is @ref fromInteger which rejects values that
    /// the address space does not accept.
    ///
    /// @tparam AddressSpace Provides the storage type and the validity predicate.
    template<typename AddressSpace>
    class Address {
    public:
        using Space = AddressSpace;
        using Storage = typename AddressSpace::Storage;

    private:
        Storage mAddress;

        constexpr explicit Address(Storage address) noexcept
            : mAddress(address)
        { }

    public:
        /// @brief The null address, valid in every address space.
        constexpr Address() noexcept
            : mAddress(0)
        { }

        constexpr Address(std::nullptr_t) noexcept
            : mAddress(0)
        { }

        [[nodiscard]]
        static constexpr std::optional<Address> fromInteger(Storage value) noexcept {
            if (!AddressSpace::isValid(value)) {
                return std::nullopt;
            }

            return Address { value };
        }

        constexpr Storage toInteger() const noexcept {
            return mAddress;
        }

        constexpr bool isNull() const noexcept {
            return mAddress == 0;
        }

        /// @brief Test if the address is aligned to @p alignment.
        ///
        /// @param alignment The alignment to test against.
        ///
        /// @return False if @p alignment is not a power of 2, otherwise true if the low bits are clear.
        constexpr bool isAligned(size_t alignment) const noexcept {
            if (!std::has_single_bit(alignment)) {
                return false;
            }

            return (mAddress & (alignment - 1)) == 0;
        }

        /// @brief Add a byte offset to the address.
        ///
        /// @return The new address, or nothing if the result overflows or leaves the address space.
        [[nodiscard]]
        constexpr std::optional<Address> offset(Storage bytes) const noexcept {
            Storage result;
            if (__builtin_add_overflow(mAddress, bytes, &result)) {
                return std::nullopt;
            }

            return fromInteger(result);
        }

        template<typename T> requires (AddressSpace::kIsVirtual)
        T *as() const noexcept {
            return std::bit_cast<T*>(mAddress);
        }

        template<typename T> requires (AddressSpace::kIsVirtual)
        static std::optional<Address> fromPointer(const T *pointer) noexcept {
            return fromInteger(std::bit_cast<Storage>(pointer));
        }

        constexpr auto operator<=>(const Address& other) const noexcept = default;
    };
}

template<typename AddressSpace>
struct std::hash<sm::Address<AddressSpace>> {
    size_t operator()(const sm::Address<AddressSpace>& address) const noexcept {
        return std::hash<typename AddressSpace::Storage>()(address.toInteger());
    }
};
