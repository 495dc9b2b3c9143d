#ifndef FLOWGRAPH_DEBUG_LOG_HPP
#define FLOWGRAPH_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace flowgraph {
namespace debug {

enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

// Callback for routing log output into a host application.
// The callback receives a formatted string (no newline at end)
using LogCallback = void (*)(LogLevel level, const char* message);

// When null, messages go to stderr
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline std::atomic<int> g_min_level{static_cast<int>(LogLevel::WARN)};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_log_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel get_log_level() {
    return static_cast<LogLevel>(g_min_level.load(std::memory_order_relaxed));
}

inline bool is_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load(std::memory_order_relaxed);
}

// Internal: format and output a message
inline void log_output(LogLevel level, const char* fmt, ...) {
    if (!is_enabled(level)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    // Add thread ID prefix
    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace debug
} // namespace flowgraph

// Trace output for scanner and cache internals, compiled out by default
#ifdef FLOWGRAPH_ENABLE_DEBUG_OUTPUT
    #define FLOWGRAPH_DEBUG_LOG(fmt, ...) \
        ::flowgraph::debug::log_output(::flowgraph::debug::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#else
    #define FLOWGRAPH_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#define FLOWGRAPH_LOG_INFO(fmt, ...) \
    ::flowgraph::debug::log_output(::flowgraph::debug::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define FLOWGRAPH_LOG_WARN(fmt, ...) \
    ::flowgraph::debug::log_output(::flowgraph::debug::LogLevel::WARN, fmt, ##__VA_ARGS__)
#define FLOWGRAPH_LOG_ERROR(fmt, ...) \
    ::flowgraph::debug::log_output(::flowgraph::debug::LogLevel::ERROR, fmt, ##__VA_ARGS__)

#endif // FLOWGRAPH_DEBUG_LOG_HPP
