#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace redub {

struct LogEntry {
    char message[512];
    int level;
};

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /// Parse "off", "warn", "info", "debug" or "trace". Returns false and
    /// leaves `level` untouched for anything else.
    static bool parseLevel(const char* text, LogLevel& level);

    // Control-thread logging: formatted straight to stderr (or the callback)
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Audio-thread logging: lock-free push into the ring, drained later.
    // vsnprintf with %d/%s/%p is allocation-free on the platforms we ship on;
    // keep %f arguments small on the RT thread.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Flush RT entries (control thread only)
    static void drain();

    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();
    static void emit(int level, const char* message);

    static std::atomic<int> level_;

    static constexpr int kRingCapacity = 1024;
    static std::array<LogEntry, kRingCapacity + 1> ringBuffer_;
    static std::atomic<int> readPos_;
    static std::atomic<int> writePos_;

    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace redub

// --- Macros ---

#define RD_LOG_IMPL(lvl, fn, fmt, ...) \
    do { if (redub::Logger::getLevel() >= redub::LogLevel::lvl) \
        redub::Logger::fn(redub::LogLevel::lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RD_WARN(fmt, ...)     RD_LOG_IMPL(warn,  log,   fmt, ##__VA_ARGS__)
#define RD_WARN_RT(fmt, ...)  RD_LOG_IMPL(warn,  logRT, fmt, ##__VA_ARGS__)
#define RD_INFO(fmt, ...)     RD_LOG_IMPL(info,  log,   fmt, ##__VA_ARGS__)
#define RD_INFO_RT(fmt, ...)  RD_LOG_IMPL(info,  logRT, fmt, ##__VA_ARGS__)
#define RD_DEBUG(fmt, ...)    RD_LOG_IMPL(debug, log,   fmt, ##__VA_ARGS__)
#define RD_DEBUG_RT(fmt, ...) RD_LOG_IMPL(debug, logRT, fmt, ##__VA_ARGS__)
#define RD_TRACE(fmt, ...)    RD_LOG_IMPL(trace, log,   fmt, ##__VA_ARGS__)
#define RD_TRACE_RT(fmt, ...) RD_LOG_IMPL(trace, logRT, fmt, ##__VA_ARGS__)
