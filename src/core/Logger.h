#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace risset {

struct LogEntry {
    char message[512];
    int level;
};

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Control-thread logging, straight to stderr or the host callback
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Timing-thread logging (scheduler workers, audio callback).
    // Lock-free push into the ring; entries appear on the next drain().
    // Several timing threads may log at once, so writers claim a slot
    // with a CAS on writePos_ before filling it.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Drain RT ring (control thread only)
    static void drain();

    // Number of RT entries dropped because the ring was full
    static int droppedCount();

    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();
    static void emit(int level, const char* message);

    static std::atomic<int> level_;

    static constexpr int kRingCapacity = 1024;
    static std::array<LogEntry, kRingCapacity + 1> ringBuffer_;
    static std::array<std::atomic<bool>, kRingCapacity + 1> ready_;
    static std::atomic<int> readPos_;
    static std::atomic<int> writePos_;
    static std::atomic<int> dropped_;

    static std::chrono::steady_clock::time_point startTime_;
    static std::atomic<LogCallback> callback_;
    static std::atomic<void*> callbackUserData_;
};

} // namespace risset

// --- Macros ---

#define RS_WARN(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::warn) \
        risset::Logger::log(risset::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_WARN_RT(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::warn) \
        risset::Logger::logRT(risset::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_INFO(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::info) \
        risset::Logger::log(risset::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_INFO_RT(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::info) \
        risset::Logger::logRT(risset::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_DEBUG(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::debug) \
        risset::Logger::log(risset::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_DEBUG_RT(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::debug) \
        risset::Logger::logRT(risset::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_TRACE(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::trace) \
        risset::Logger::log(risset::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define RS_TRACE_RT(fmt, ...) \
    do { if (risset::Logger::getLevel() >= risset::LogLevel::trace) \
        risset::Logger::logRT(risset::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)
