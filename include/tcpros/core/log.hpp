#pragma once

#include <type_traits>

#include "tcpros/core/types.hpp"

namespace tcpros::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info,
        Warn,
        Error,
    };

    using LogFn = void (*)(void* user, LogLevel level, const char* msg) noexcept;

    // Diagnostic sink handed to library code. A null fn drops everything.
    struct LogSink {
        LogFn fn{nullptr};
        void* user{nullptr};
    };

    // Longest formatted message; longer output is truncated.
    inline constexpr u32 kLogMessageMax = 1024;

    [[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

    // "<level>: <msg>\n" on stderr.
    [[nodiscard]] LogSink log_stderr_sink() noexcept;
    [[nodiscard]] LogSink log_null_sink() noexcept;

#if defined(__GNUC__)
    void log_write(const LogSink& sink, LogLevel level, const char* fmt, ...) noexcept
        __attribute__((format(printf, 3, 4)));
#else
    void log_write(const LogSink& sink, LogLevel level, const char* fmt, ...) noexcept;
#endif

    static_assert(std::is_trivially_copyable_v<LogSink>);
    static_assert(std::is_standard_layout_v<LogSink>);

} // namespace tcpros::core
