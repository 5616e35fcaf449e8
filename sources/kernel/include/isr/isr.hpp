#pragma once

#include <kestrel/status.h>

#include "isr/catalog.hpp"
#include "isr/idt.hpp"
#include "util/util.hpp"

#include <atomic>
#include <stdint.h>

namespace kr {
    /// @brief The frame the CPU pushes when delivering an interrupt.
    ///
    /// @details The ISR implementation is split across several files:
    /// - isr.S: The per vector stubs and the common entry point.
    /// - idt.cpp: The interrupt descriptor table.
    /// - dispatch.cpp: Dispatch to the handler table and the default handler.
    /// - exceptions.cpp: The exception handlers installed during setup.
    ///
    /// isr.S is only part of the kernel, everything else is usable in
    /// hosted builds for testing.
    struct InterruptFrame {
        uint64_t rip;
        uint64_t cs;
        uint64_t rflags;
        uint64_t rsp;
        uint64_t ss;
    };

    static_assert(sizeof(InterruptFrame) == 40, "Update isr.S");
    static_assert(alignof(InterruptFrame) == 8);

    /// @brief An interrupt handler.
    ///
    /// @param frame The interrupted context, owned by the interrupted code and must not be moved.
    /// @param vector The vector that was raised.
    /// @param error The error code, 0 for vectors without one.
    using IsrHandler = void(*)(InterruptFrame *frame, Vector vector, uint64_t error);
    using IsrEntry = std::atomic<IsrHandler>;

    /// @brief The default handler, used for vectors without a handler.
    ///
    /// Unhandled exceptions are fatal, unhandled user interrupts are logged and dismissed.
    void DefaultIsrHandler(InterruptFrame *frame, Vector vector, uint64_t error);

    /// @brief The handlers for every vector.
    class IsrTable {
        IsrEntry mHandlers[isr::kIsrCount]{};

    public:
        UTIL_NOCOPY(IsrTable);
        UTIL_NOMOVE(IsrTable);

        constexpr IsrTable() noexcept = default;

        /// @brief Install a handler.
        ///
        /// The caller states what the handler expects from the vector, and the install
        /// is refused if that disagrees with the architecture.
        ///
        /// @param vector The vector to handle.
        /// @param info What the handler expects.
        /// @param handler The handler.
        /// @param previous The handler that was replaced, or null.
        ///
        /// @retval OsStatusInvalidInput @p info does not match @p vector or @p handler is null.
        OsStatus install(Vector vector, VectorInfo info, IsrHandler handler, IsrHandler *previous = nullptr);

        /// @brief Remove the handler for a vector.
        ///
        /// @return The handler that was removed, or null.
        IsrHandler remove(Vector vector);

        /// @brief Get the handler of a vector, or null if there is none.
        IsrHandler get(Vector vector) const;
    };

    /// @brief The kernel's handler table.
    IsrTable& GetIsrTable();

    /// @brief Run the handler for a vector.
    ///
    /// Bug checks if the handler of a vector that must not return returns.
    void DispatchInterrupt(const IsrTable& table, InterruptFrame *frame, Vector vector, uint64_t error);

    /// @brief Install a handler for a user interrupt and point its gate at the ISR stub.
    ///
    /// @retval OsStatusInvalidInput @p vector is an exception or @p handler is null.
    OsStatus InstallIsr(Vector vector, IsrHandler handler);

    /// @brief Address of the stub in isr.S for a vector.
    uintptr_t GetIsrStub(Vector vector);

    /// @brief Mask maskable interrupts on this processor.
    void DisableInterrupts();
}

template<>
struct kr::Format<kr::InterruptFrame> {
    static void format(kr::IOutStream& out, const kr::InterruptFrame& value);
};

/// @brief Distance between the stubs in isr.S.
static constexpr size_t kIsrStubStride = 16;

/// @brief The first stub in isr.S, the rest follow every @ref kIsrStubStride bytes.
extern "C" const char KrIsrTable[];

/// @brief Called by isr.S for every interrupt.
extern "C" void KrIsrDispatchRoutine(kr::InterruptFrame *frame, uint8_t vector, uint64_t error);
