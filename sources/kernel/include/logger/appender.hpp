#pragma once

#include "std/static_string.hpp"
#include "std/string_view.hpp"

#include <source_location>

#include <stddef.h>
#include <stdint.h>

namespace kr {
    class Logger;
    class LogQueue;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        ePrint = 0,
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    namespace detail {
        /// @brief A message held in the queue until the appenders are free.
        struct LogMessage {
            LogLevel level = LogLevel::ePrint;
            std::source_location location;
            const Logger *logger = nullptr;
            stdx::StaticString<kLogMessageSize> message;
        };
    }

    struct LogMessageView {
        std::source_location location;
        stdx::StringView message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        /// @brief Write a single message.
        ///
        /// Called with the queue lock held, implementations never run concurrently.
        virtual void write(const LogMessageView& message) = 0;
    };
}
