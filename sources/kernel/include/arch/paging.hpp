#pragma once

#include <stdint.h>
#include <stddef.h>

namespace x64 {
    constexpr void setmask(uint64_t& value, uint64_t mask, bool state) noexcept {
        if (state) {
            value |= mask;
        } else {
            value &= ~mask;
        }
    }

    constexpr uintptr_t kPageSize = 0x1000;
    constexpr uintptr_t kLargePageSize = 0x20'0000;
    constexpr uintptr_t kHugePageSize = 0x4000'0000;

    namespace paging {
        constexpr uint64_t kPresentBit        = 1ull << 0;
        constexpr uint64_t kWriteableBit      = 1ull << 1;
        constexpr uint64_t kUserBit           = 1ull << 2;
        constexpr uint64_t kWriteThroughBit   = 1ull << 3;
        constexpr uint64_t kCacheDisableBit   = 1ull << 4;
        constexpr uint64_t kAccessedBit       = 1ull << 5;
        constexpr uint64_t kWrittenBit        = 1ull << 6;
        constexpr uint64_t kPageSizeBit       = 1ull << 7;
        constexpr uint64_t kGlobalBit         = 1ull << 8;
        constexpr uint64_t kExecuteDisableBit = 1ull << 63;

        constexpr uintptr_t addressMask(uintptr_t width) {
            return ((1ull << width) - 1) & ~(kPageSize - 1);
        }

        /// @brief Bits of an entry that hold the physical address of the next level or the page.
        constexpr uintptr_t kAddressMask = addressMask(52);

        static_assert(addressMask(40) == 0x0000'00ff'ffff'f000ull);
        static_assert(addressMask(48) == 0x0000'ffff'ffff'f000ull);
        static_assert(kAddressMask == 0x000f'ffff'ffff'f000ull);

        /// @brief Number of entries in every level of the paging hierarchy.
        constexpr size_t kEntryCount = 512;
    }

    struct Entry {
        uint64_t underlying;

        constexpr bool present() const noexcept { return underlying & paging::kPresentBit; }
        constexpr void setPresent(bool present) noexcept { setmask(underlying, paging::kPresentBit, present); }

        constexpr bool writeable() const noexcept { return underlying & paging::kWriteableBit; }
        constexpr void setWriteable(bool writeable) noexcept { setmask(underlying, paging::kWriteableBit, writeable); }

        constexpr bool user() const noexcept { return underlying & paging::kUserBit; }
        constexpr void setUser(bool user) noexcept { setmask(underlying, paging::kUserBit, user); }

        constexpr bool global() const noexcept { return underlying & paging::kGlobalBit; }
        constexpr void setGlobal(bool global) noexcept { setmask(underlying, paging::kGlobalBit, global); }

        constexpr bool executable() const noexcept { return !(underlying & paging::kExecuteDisableBit); }
        constexpr void setExecutable(bool exec) noexcept { setmask(underlying, paging::kExecuteDisableBit, !exec); }

        constexpr uintptr_t address() const noexcept { return underlying & paging::kAddressMask; }
        constexpr void setAddress(uintptr_t address) noexcept {
            underlying = (underlying & ~paging::kAddressMask) | (address & paging::kAddressMask);
        }
    };

    /// @brief Page table entry
    struct pte : Entry { };

    /// @brief Page directory entry
    struct pdte : Entry {
        constexpr bool is2m() const noexcept { return underlying & paging::kPageSizeBit; }
        constexpr void set2m(bool large) noexcept { setmask(underlying, paging::kPageSizeBit, large); }
    };

    /// @brief Page directory pointer table entry
    struct pdpte : Entry {
        constexpr bool is1g() const noexcept { return underlying & paging::kPageSizeBit; }
        constexpr void set1g(bool huge) noexcept { setmask(underlying, paging::kPageSizeBit, huge); }
    };

    /// @brief Page map level 4 entry
    struct pml4e : Entry { };

    struct alignas(kPageSize) PageTable {
        pte entries[paging::kEntryCount];
    };

    struct alignas(kPageSize) PageMapLevel2 {
        pdte entries[paging::kEntryCount];
    };

    struct alignas(kPageSize) PageMapLevel3 {
        pdpte entries[paging::kEntryCount];
    };

    struct alignas(kPageSize) PageMapLevel4 {
        pml4e entries[paging::kEntryCount];
    };

    static_assert(sizeof(PageTable) == kPageSize);
    static_assert(sizeof(PageMapLevel2) == kPageSize);
    static_assert(sizeof(PageMapLevel3) == kPageSize);
    static_assert(sizeof(PageMapLevel4) == kPageSize);

    struct PageWalkIndices {
        uint16_t pml4e;
        uint16_t pdpte;
        uint16_t pdte;
        uint16_t pte;
    };

    constexpr PageWalkIndices GetAddressParts(uintptr_t address) noexcept {
        uint16_t pml4e = (address >> 39) & 0b0001'1111'1111;
        uint16_t pdpte = (address >> 30) & 0b0001'1111'1111;
        uint16_t pdte = (address >> 21) & 0b0001'1111'1111;
        uint16_t pte = (address >> 12) & 0b0001'1111'1111;

        return PageWalkIndices { pml4e, pdpte, pdte, pte };
    }
}
