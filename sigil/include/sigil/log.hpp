#pragma once
// Log: component-tagged diagnostics on stderr
//
//   [14:02:11.532][pipeline] Executed 3 PRE effects for ENCOUNTER:e1
//
// Output goes to stderr so stdout stays clean for JSON-RPC responses.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>

namespace sigil::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

inline std::atomic<int>& threshold_storage() {
    static std::atomic<int> threshold{static_cast<int>(Level::Warn)};
    return threshold;
}

inline void set_level(Level level) {
    threshold_storage().store(static_cast<int>(level));
}

inline Level level() {
    return static_cast<Level>(threshold_storage().load());
}

inline bool enabled(Level lvl) {
    return static_cast<int>(lvl) >= threshold_storage().load();
}

inline const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "unknown";
}

// Parse "debug" / "info" / "warn" / "error" / "off"; unknown names keep fallback
inline Level parse_level(const std::string& name, Level fallback = Level::Warn) {
    if (name == "debug" || name == "verbose") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off" || name == "quiet") return Level::Off;
    return fallback;
}

inline void vwrite(Level lvl, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    // One fprintf per line
    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    if (lvl >= Level::Warn) {
        std::fprintf(stderr, "[%s.%03d][%s] %s: %s\n", time_buf,
                     static_cast<int>(now_ms.count()), component, level_name(lvl), msg);
    } else {
        std::fprintf(stderr, "[%s.%03d][%s] %s\n", time_buf,
                     static_cast<int>(now_ms.count()), component, msg);
    }
}

inline void debug(const char* component, const char* fmt, ...) {
    if (!enabled(Level::Debug)) return;
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Debug, component, fmt, args);
    va_end(args);
}

inline void info(const char* component, const char* fmt, ...) {
    if (!enabled(Level::Info)) return;
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Info, component, fmt, args);
    va_end(args);
}

inline void warn(const char* component, const char* fmt, ...) {
    if (!enabled(Level::Warn)) return;
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Warn, component, fmt, args);
    va_end(args);
}

inline void error(const char* component, const char* fmt, ...) {
    if (!enabled(Level::Error)) return;
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace sigil::log
