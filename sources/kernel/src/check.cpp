#include "panic.hpp"

#include "arch/intrin.hpp"
#include "logger/categories.hpp"

#include <string>

[[noreturn]]
void KrHalt(void) {
    for (;;) {
        __cli();
        __halt();
    }
}

void kr::BugCheck(stdx::StringView message, std::source_location where) {
    InitLog.fatalf("Bug check '", message, "'");
    stdx::StringView fn(where.function_name(), where.function_name() + std::char_traits<char>::length(where.function_name()));
    stdx::StringView file(where.file_name(), where.file_name() + std::char_traits<char>::length(where.file_name()));
    InitLog.fatalf(fn, " (", file, ":", where.line(), ")");
    KrHalt();
}
