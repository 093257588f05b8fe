#pragma once
/**
 * @file diag.hpp
 * @brief Fallback diagnostics channel.
 *
 * Internal problems (sink I/O failures, dropped events, config warnings) are
 * reported as single "activity-log: ..." lines on a FILE* stream, stderr by
 * default. The channel never throws.
 */

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace activity {
namespace diag {

/** @brief Severity prefix printed after "activity-log: ". */
enum class Level {
    Warning,
    Error
};

inline std::mutex& diag_mutex() {
    static std::mutex m;
    return m;
}

inline void vreport(FILE* out, Level level, const char* fmt, va_list ap) {
    if (!out) out = stderr;
    std::lock_guard<std::mutex> lock(diag_mutex());
    std::fputs(level == Level::Error ? "activity-log: ERROR: " : "activity-log: Warning: ", out);
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
}

inline void warn(FILE* out, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vreport(out, Level::Warning, fmt, ap);
    va_end(ap);
}

inline void error(FILE* out, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vreport(out, Level::Error, fmt, ap);
    va_end(ap);
}

} // namespace diag
} // namespace activity
