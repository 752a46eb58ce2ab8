#include "tcpros/core/log.hpp"

#include <cstdarg>
#include <cstdio>

namespace tcpros::core {
    namespace {
        void stderr_fn(void* user, LogLevel level, const char* msg) noexcept {
            (void)user;
            std::fprintf(stderr, "%s: %s\n", log_level_name(level), msg);
        }
    } // namespace

    const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warning";
        case LogLevel::Error: return "error";
        }
        return "log";
    }

    LogSink log_stderr_sink() noexcept {
        return LogSink{&stderr_fn, nullptr};
    }

    LogSink log_null_sink() noexcept {
        return LogSink{};
    }

    void log_write(const LogSink& sink, LogLevel level, const char* fmt, ...) noexcept {
        if (sink.fn == nullptr || fmt == nullptr) {
            return;
        }

        char buf[kLogMessageMax];
        va_list ap;
        va_start(ap, fmt);
        const int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
        va_end(ap);
        if (n < 0) {
            return;
        }

        sink.fn(sink.user, level, buf);
    }
} // namespace tcpros::core
