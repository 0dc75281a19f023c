#pragma once
#include <fmt/format.h>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

namespace dsprof {

enum class log_level { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

inline log_level parse_log_level(std::string_view s, log_level fallback = log_level::warn) {
    if (s == "debug") return log_level::debug;
    if (s == "info")  return log_level::info;
    if (s == "warn" || s == "warning") return log_level::warn;
    if (s == "error") return log_level::error;
    if (s == "off" || s == "none") return log_level::off;
    return fallback;
}

// Process-wide threshold, seeded from DSPROF_LOG_LEVEL.
inline std::atomic<int>& log_threshold() {
    static std::atomic<int> level{[] {
        const char* env = std::getenv("DSPROF_LOG_LEVEL");
        return static_cast<int>(env ? parse_log_level(env) : log_level::warn);
    }()};
    return level;
}

inline void set_log_level(log_level level) { log_threshold().store(static_cast<int>(level)); }

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) >= log_threshold().load(std::memory_order_relaxed);
}

template <typename... Args>
void log_at(log_level level, const char* prefix, fmt::format_string<Args...> f, Args&&... args) {
    if (!log_enabled(level)) return;
    // one formatted write per line so concurrent workers do not interleave mid-line
    const std::string line = fmt::format("{}: {}\n", prefix, fmt::format(f, std::forward<Args>(args)...));
    std::fputs(line.c_str(), stderr);
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    log_at(log_level::debug, "DEBUG", f, std::forward<Args>(args)...);
}
template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    log_at(log_level::info, "INFO", f, std::forward<Args>(args)...);
}
template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    log_at(log_level::warn, "WARN", f, std::forward<Args>(args)...);
}
template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    log_at(log_level::error, "ERROR", f, std::forward<Args>(args)...);
}

}
