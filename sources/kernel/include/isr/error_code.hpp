#pragma once

#include "util/format.hpp"

#include <optional>
#include <stdint.h>

namespace kr {
    enum class DescriptorTable : uint8_t {
        eGdt,
        eIdt,
        eLdt,
    };

    /// @brief Error code of exceptions that reference a segment selector.
    ///
    /// Pushed by #TS, #NP, #SS, #GP and #AC. A zero error code does not reference
    /// a selector.
    class SelectorErrorCode {
        uint32_t mValue;

        constexpr SelectorErrorCode(uint32_t value) noexcept
            : mValue(value)
        { }

    public:
        static constexpr std::optional<SelectorErrorCode> of(uint64_t error) noexcept {
            if (uint32_t(error) == 0) {
                return std::nullopt;
            }

            return SelectorErrorCode(uint32_t(error));
        }

        constexpr uint32_t value() const noexcept { return mValue; }

        /// @brief The exception happened while delivering an external event.
        constexpr bool external() const noexcept { return mValue & (1 << 0); }

        constexpr DescriptorTable table() const noexcept {
            if (mValue & (1 << 1)) {
                return DescriptorTable::eIdt;
            }

            return (mValue & (1 << 2)) ? DescriptorTable::eLdt : DescriptorTable::eGdt;
        }

        constexpr uint16_t index() const noexcept { return (mValue >> 3) & 0x1FFF; }
    };

    /// @brief Error code of #PF.
    class PageFaultErrorCode {
        uint32_t mValue;

    public:
        enum Bit : uint32_t {
            ePresent = (1 << 0),
            eWrite = (1 << 1),
            eUser = (1 << 2),
            eReserved = (1 << 3),
            eFetch = (1 << 4),
            eProtectionKey = (1 << 5),
            eShadowStack = (1 << 6),
            eSgx = (1 << 15),
        };

        constexpr PageFaultErrorCode(uint64_t error) noexcept
            : mValue(uint32_t(error))
        { }

        constexpr uint32_t value() const noexcept { return mValue; }

        constexpr bool test(Bit bit) const noexcept { return mValue & bit; }
    };

    /// @brief Error code of #CP.
    class ControlProtectionErrorCode {
        uint32_t mValue;

    public:
        enum Cause : uint16_t {
            eNearRet = 1,
            eFarRet = 2,
            eEndBranch = 3,
            eRstorSsp = 4,
            eSetSsBsy = 5,
        };

        constexpr ControlProtectionErrorCode(uint64_t error) noexcept
            : mValue(uint32_t(error))
        { }

        constexpr uint32_t value() const noexcept { return mValue; }

        constexpr Cause cause() const noexcept { return Cause(mValue & 0x7FFF); }

        /// @brief The violation happened inside an enclave.
        constexpr bool enclave() const noexcept { return mValue & (1 << 15); }
    };

    /// @brief Error code of #VC, the exit code of the intercepted event.
    class VmExitCode {
        uint32_t mValue;

    public:
        enum Exit : uint32_t {
            eWriteDr7 = 0x37,
            eRdtsc = 0x6E,
            eRdpmc = 0x6F,
            eCpuid = 0x72,
            eIoio = 0x7B,
            eMsr = 0x7C,
            eVmmcall = 0x81,
            eRdtscp = 0x87,
            eWbinvd = 0x89,
            eMonitor = 0x8A,
            eMwait = 0x8B,
            eNestedPageFault = 0x400,
        };

        constexpr VmExitCode(uint64_t error) noexcept
            : mValue(uint32_t(error))
        { }

        constexpr uint32_t value() const noexcept { return mValue; }

        constexpr Exit exit() const noexcept { return Exit(mValue); }
    };

    /// @brief Error code of #SX.
    class SecurityErrorCode {
        uint32_t mValue;

    public:
        constexpr SecurityErrorCode(uint64_t error) noexcept
            : mValue(uint32_t(error))
        { }

        constexpr uint32_t value() const noexcept { return mValue; }

        /// @brief An INIT was redirected to the hypervisor.
        constexpr bool isInitRedirection() const noexcept { return mValue == 1; }
    };
}

template<>
struct kr::Format<kr::DescriptorTable> {
    static void format(kr::IOutStream& out, kr::DescriptorTable value);
};

template<>
struct kr::Format<kr::SelectorErrorCode> {
    static void format(kr::IOutStream& out, kr::SelectorErrorCode value);
};

template<>
struct kr::Format<kr::PageFaultErrorCode> {
    static void format(kr::IOutStream& out, kr::PageFaultErrorCode value);
};

template<>
struct kr::Format<kr::ControlProtectionErrorCode> {
    static void format(kr::IOutStream& out, kr::ControlProtectionErrorCode value);
};

template<>
struct kr::Format<kr::VmExitCode> {
    static void format(kr::IOutStream& out, kr::VmExitCode value);
};

template<>
struct kr::Format<kr::SecurityErrorCode> {
    static void format(kr::IOutStream& out, kr::SecurityErrorCode value);
};
