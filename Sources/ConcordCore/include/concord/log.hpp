#pragma once

#include <cstdio>
#include <atomic>
#include <string>

namespace concord {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

inline std::atomic<log_level>& current_log_level() {
    static std::atomic<log_level> level{log_level::off};
    return level;
}

inline void set_log_level(log_level level) {
    current_log_level().store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return current_log_level().load(std::memory_order_relaxed);
}

/// Parse "off" / "error" / "warn" / "info" / "debug". Unknown names map to off.
inline log_level log_level_from_string(const std::string& name) {
    if (name == "error") return log_level::error;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return log_level::off;
}

}  // namespace concord

#define CONCORD_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(concord::current_log_level().load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) CONCORD_LOG(concord::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  CONCORD_LOG(concord::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  CONCORD_LOG(concord::log_level::info, tag, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(tag, fmt, ...) CONCORD_LOG(concord::log_level::debug, tag, fmt, ##__VA_ARGS__)
