#include "logger/e9_appender.hpp"

#include "logger/logger.hpp"

#include "arch/intrin.hpp"

static void WriteString(stdx::StringView text) {
    for (char c : text) {
        arch::Intrin::outbyte(kr::E9Appender::kLogPort, c);
    }
}

void kr::E9Appender::write(const LogMessageView& message) {
    if (message.level == LogLevel::ePrint) {
        WriteString(message.message);
        return;
    }

    WriteString("[");
    WriteString(message.logger->getName());
    WriteString("] ");
    WriteString(message.message);
    arch::Intrin::outbyte(kLogPort, '\n');
}

bool kr::E9Appender::isAvailable() noexcept {
    return arch::Intrin::inbyte(kLogPort) == kLogPort;
}
