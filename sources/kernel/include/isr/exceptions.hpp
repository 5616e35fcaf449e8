#pragma once

#include "isr/isr.hpp"

#include <array>

namespace kr {
    /// @brief Handlers for the architectural exceptions.
    ///
    /// Each exception has one optional handler slot. Slots that are empty are
    /// handled by @ref DefaultIsrHandler once installed.
    class ExceptionTable {
        std::array<IsrHandler, isr::kExceptionCount> mHandlers{};

    public:
        constexpr ExceptionTable() noexcept = default;

        /// @brief Set the handler of an exception.
        ///
        /// @retval OsStatusInvalidInput @p vector is not an exception or is reserved.
        constexpr OsStatus set(Vector vector, IsrHandler handler) noexcept {
            if (!vector.isException() || GetExceptionInfo(vector).isReserved()) {
                return OsStatusInvalidInput;
            }

            mHandlers[vector.value()] = handler;
            return OsStatusSuccess;
        }

        constexpr IsrHandler get(Vector vector) const noexcept {
            if (!vector.isException()) {
                return nullptr;
            }

            return mHandlers[vector.value()];
        }

        /// @brief Install every handler that is set into @p table.
        OsStatus install(IsrTable& table) const;
    };

    /// @brief Handler for #DF, reports the fault and halts.
    [[noreturn]]
    void DoubleFaultHandler(InterruptFrame *frame, Vector vector, uint64_t error);

    /// @brief The exception handlers installed during setup.
    ///
    /// Always contains the double fault handler.
    ExceptionTable GetDefaultExceptionTable();
}
