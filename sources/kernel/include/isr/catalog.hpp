#pragma once

#include <kestrel/status.h>

#include "isr/vector.hpp"

#include <array>
#include <optional>

namespace kr {
    enum class ExceptionClass : uint8_t {
        eFault,
        eTrap,
        eFaultOrTrap,
        eInterrupt,
        eAbort,
        eReserved,
    };

    /// @brief How an exception contributes to a double fault.
    enum class Contribution : uint8_t {
        eBenign,
        eContributory,
        ePageFault,
    };

    /// @brief The error code an exception pushes.
    enum class ErrorCodeShape : uint8_t {
        eNone,

        /// @brief An error code that is always zero.
        eZero,

        eSelector,
        ePageFault,
        eControlProtection,
        eVmExit,
        eSecurity,
    };

    struct ExceptionInfo {
        uint8_t vector;
        stdx::StringView mnemonic;
        stdx::StringView name;
        ExceptionClass kind;
        Contribution contribution;
        ErrorCodeShape errorCode;

        constexpr bool hasErrorCode() const noexcept { return errorCode != ErrorCodeShape::eNone; }
        constexpr bool isReserved() const noexcept { return kind == ExceptionClass::eReserved; }
    };

    /// @brief What a handler for a vector can expect.
    struct VectorInfo {
        /// @brief Size of the error code the CPU pushes, either 0 or 8 bytes.
        uint8_t errorCodeSize;

        /// @brief The handler must never return to the interrupted code.
        bool mustNotReturn;

        constexpr bool operator==(const VectorInfo&) const noexcept = default;
    };

    namespace detail {
        using enum ExceptionClass;
        using enum ErrorCodeShape;

        constexpr Contribution kBenign = Contribution::eBenign;
        constexpr Contribution kContributory = Contribution::eContributory;
        constexpr Contribution kPageFault = Contribution::ePageFault;

        constexpr ExceptionInfo Reserved(uint8_t vector) noexcept {
            return ExceptionInfo { vector, "--", "Reserved", eReserved, kBenign, eNone };
        }

        constexpr std::array<ExceptionInfo, isr::kExceptionCount> kExceptionCatalog = {{
            { isr::DE,  "#DE", "Divide Error",                  eFault,       kContributory, eNone },
            { isr::DB,  "#DB", "Debug",                         eFaultOrTrap, kBenign,       eNone },
            { isr::NMI, "NMI", "Non-Maskable Interrupt",        eInterrupt,   kBenign,       eNone },
            { isr::BP,  "#BP", "Breakpoint",                    eTrap,        kBenign,       eNone },
            { isr::OF,  "#OF", "Overflow",                      eTrap,        kBenign,       eNone },
            { isr::BR,  "#BR", "Bound Range Exceeded",          eFault,       kBenign,       eNone },
            { isr::UD,  "#UD", "Invalid Opcode",                eFault,       kBenign,       eNone },
            { isr::NM,  "#NM", "Device Not Available",          eFault,       kBenign,       eNone },
            { isr::DF,  "#DF", "Double Fault",                  eAbort,       kBenign,       eZero },
            Reserved(0x09),
            { isr::TS,  "#TS", "Invalid TSS",                   eFault,       kContributory, eSelector },
            { isr::NP,  "#NP", "Segment Not Present",           eFault,       kContributory, eSelector },
            { isr::SS,  "#SS", "Stack Segment Fault",           eFault,       kContributory, eSelector },
            { isr::GP,  "#GP", "General Protection",            eFault,       kContributory, eSelector },
            { isr::PF,  "#PF", "Page Fault",                    eFault,       kPageFault,    ePageFault },
            Reserved(0x0F),
            { isr::MF,  "#MF", "x87 Floating Point",            eFault,       kBenign,       eNone },
            { isr::AC,  "#AC", "Alignment Check",               eFault,       kBenign,       eZero },
            { isr::MC,  "#MC", "Machine Check",                 eAbort,       kBenign,       eNone },
            { isr::XM,  "#XM", "SIMD Floating Point",           eFault,       kBenign,       eNone },
            { isr::VE,  "#VE", "Virtualization",                eFault,       kBenign,       eNone },
            { isr::CP,  "#CP", "Control Protection",            eFault,       kContributory, eControlProtection },
            Reserved(0x16),
            Reserved(0x17),
            Reserved(0x18),
            Reserved(0x19),
            Reserved(0x1A),
            Reserved(0x1B),
            { isr::HV,  "#HV", "Hypervisor Injection",          eFault,       kBenign,       eNone },
            { isr::VC,  "#VC", "VMM Communication",             eFault,       kContributory, eVmExit },
            { isr::SX,  "#SX", "Security",                      eFault,       kContributory, eSecurity },
            Reserved(0x1F),
        }};

        //
        // Written out independently of the catalog so that the two can be
        // checked against each other.
        //
        constexpr std::array<VectorInfo, isr::kExceptionCount> kExceptionVectorTable = {{
            /* #DE */ { 0, false }, /* #DB */ { 0, false }, /* NMI */ { 0, false }, /* #BP */ { 0, false },
            /* #OF */ { 0, false }, /* #BR */ { 0, false }, /* #UD */ { 0, false }, /* #NM */ { 0, false },
            /* #DF */ { 8, true  }, /* 09h */ { 0, false }, /* #TS */ { 8, false }, /* #NP */ { 8, false },
            /* #SS */ { 8, false }, /* #GP */ { 8, false }, /* #PF */ { 8, false }, /* 0Fh */ { 0, false },
            /* #MF */ { 0, false }, /* #AC */ { 8, false }, /* #MC */ { 0, true  }, /* #XM */ { 0, false },
            /* #VE */ { 0, false }, /* #CP */ { 8, false }, /* 16h */ { 0, false }, /* 17h */ { 0, false },
            /* 18h */ { 0, false }, /* 19h */ { 0, false }, /* 1Ah */ { 0, false }, /* 1Bh */ { 0, false },
            /* #HV */ { 0, false }, /* #VC */ { 8, false }, /* #SX */ { 8, false }, /* 1Fh */ { 0, false },
        }};

        constexpr VectorInfo kUserVectorInfo = { 0, false };
    }

    /// @brief Get the catalog entry of an exception.
    ///
    /// @pre @p vector is an exception.
    constexpr const ExceptionInfo& GetExceptionInfo(Vector vector) noexcept {
        return detail::kExceptionCatalog[vector.value() % isr::kExceptionCount];
    }

    constexpr VectorInfo GetVectorInfo(Vector vector) noexcept {
        if (vector.isException()) {
            return detail::kExceptionVectorTable[vector.value()];
        }

        return detail::kUserVectorInfo;
    }

    /// @brief The vector info a catalog entry implies.
    constexpr VectorInfo GetCatalogVectorInfo(const ExceptionInfo& info) noexcept {
        return VectorInfo {
            .errorCodeSize = uint8_t(info.hasErrorCode() ? sizeof(uint64_t) : 0),
            .mustNotReturn = info.kind == ExceptionClass::eAbort,
        };
    }

    /// @brief Find the first vector whose static table entry disagrees with the catalog.
    ///
    /// @return The vector, or nothing if the table matches the catalog.
    constexpr std::optional<Vector> FindVectorTableMismatch() noexcept {
        for (size_t i = 0; i < isr::kExceptionCount; i++) {
            const ExceptionInfo& info = detail::kExceptionCatalog[i];
            if (info.vector != i || GetVectorInfo(uint8_t(i)) != GetCatalogVectorInfo(info)) {
                return Vector(uint8_t(i));
            }
        }

        return std::nullopt;
    }

    static_assert(!FindVectorTableMismatch().has_value(), "Vector table does not match the exception catalog");

    /// @brief Check the vector table against the exception catalog.
    ///
    /// @retval OsStatusSuccess The table matches.
    /// @retval OsStatusInvalidData An entry does not match, the mismatch is logged.
    OsStatus ValidateVectorTable();

    /// @brief Would an exception raised while delivering another escalate to a double fault.
    ///
    /// Faults raised while delivering a double fault shut down the processor and are not
    /// an escalation.
    ///
    /// @param first The exception being delivered.
    /// @param second The exception raised during delivery.
    constexpr bool IsDoubleFaultEscalation(Vector first, Vector second) noexcept {
        if (!first.isException() || !second.isException() || first == isr::DF) {
            return false;
        }

        Contribution lhs = GetExceptionInfo(first).contribution;
        Contribution rhs = GetExceptionInfo(second).contribution;

        switch (lhs) {
        case Contribution::eContributory:
            return rhs == Contribution::eContributory;
        case Contribution::ePageFault:
            return rhs != Contribution::eBenign;
        default:
            return false;
        }
    }
}

template<>
struct kr::Format<kr::ExceptionClass> {
    static void format(kr::IOutStream& out, kr::ExceptionClass value);
};
