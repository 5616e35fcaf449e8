#pragma once

#include "std/string_view.hpp"

#include <source_location>

extern "C" [[noreturn]] void KrHalt(void);

namespace kr {
    /// @brief Report an unrecoverable error and stop the system.
    ///
    /// @param message Description of the failure.
    /// @param where The call site.
    [[noreturn]]
    void BugCheck(stdx::StringView message, std::source_location where = std::source_location::current());
}

#define KR_PANIC(msg) kr::BugCheck(msg)
#define KR_CHECK(expr, msg) do { if (!(expr)) { kr::BugCheck(msg); } } while (0)
#define KR_ASSERT(expr) do { if (!(expr)) { kr::BugCheck(#expr); } } while (0)
