#pragma once

#include "logger/appender.hpp"

namespace kr {
    /// @brief Writes log messages to the QEMU and Bochs debug console port.
    class E9Appender final : public ILogAppender {
        void write(const LogMessageView& message) override;

    public:
        static constexpr uint16_t kLogPort = 0xE9;

        constexpr E9Appender() noexcept = default;

        /// @brief Test if an emulator is listening on the debug port.
        static bool isAvailable() noexcept;
    };
}
