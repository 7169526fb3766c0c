#pragma once
// Logging: timestamped, component-prefixed lines on stderr
//
//   [14:02:11.093][labelstore] seeded 120 resources from snapshot
//
// Debug lines are emitted only in verbose mode; warnings and errors always.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace zebra {
namespace log {

inline std::atomic<bool> verbose_mode{false};

inline void set_verbose(bool on) { verbose_mode = on; }
inline bool verbose() { return verbose_mode; }

inline void vwrite(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    // Single fprintf per fragment keeps concurrent lines mostly intact
    if (level) {
        std::fprintf(stderr, "[%s.%03d][%s] %s: ", time_buf,
                     static_cast<int>(now_ms.count()), component, level);
    } else {
        std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                     static_cast<int>(now_ms.count()), component);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace log

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!log::verbose()) return;

    va_list args;
    va_start(args, fmt);
    log::vwrite(nullptr, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite("WARNING", component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite("ERROR", component, fmt, args);
    va_end(args);
}

} // namespace zebra
