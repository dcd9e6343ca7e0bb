#include "core/Logger.h"

#include <cstring>

namespace risset {

// --- Static storage ---

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};

std::array<LogEntry, Logger::kRingCapacity + 1> Logger::ringBuffer_;
std::array<std::atomic<bool>, Logger::kRingCapacity + 1> Logger::ready_;
std::atomic<int> Logger::readPos_{0};
std::atomic<int> Logger::writePos_{0};
std::atomic<int> Logger::dropped_{0};

std::chrono::steady_clock::time_point Logger::startTime_ = std::chrono::steady_clock::now();

std::atomic<Logger::LogCallback> Logger::callback_{nullptr};
std::atomic<void*> Logger::callbackUserData_{nullptr};

// --- Helpers ---

static const char* basename(const char* path)
{
    const char* last = path;
    for (const char* p = path; *p; ++p)
    {
        if (*p == '/' || *p == '\\')
            last = p + 1;
    }
    return last;
}

long Logger::elapsedMs()
{
    auto now = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_);
    return static_cast<long>(ms.count());
}

static const char* levelTag(LogLevel level)
{
    switch (level)
    {
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
        case LogLevel::trace: return "trace";
        default:              return "???";
    }
}

void Logger::emit(int level, const char* message)
{
    auto cb = callback_.load(std::memory_order_acquire);
    if (cb)
        cb(level, message, callbackUserData_.load(std::memory_order_acquire));
    else
        fprintf(stderr, "%s\n", message);
}

// --- Public API ---

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    char userMsg[200];
    va_list args;
    va_start(args, fmt);
    vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    char fullMsg[256];
    snprintf(fullMsg, sizeof(fullMsg), "[%06ld][CT][%s] %s:%d %s",
             elapsedMs(), levelTag(level), basename(file), line, userMsg);

    emit(static_cast<int>(level), fullMsg);
}

void Logger::logRT(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    int w = writePos_.load(std::memory_order_relaxed);
    int nextW = 0;
    do
    {
        nextW = (w + 1) % (kRingCapacity + 1);
        if (nextW == readPos_.load(std::memory_order_acquire))
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
    } while (!writePos_.compare_exchange_weak(w, nextW,
                                              std::memory_order_acq_rel,
                                              std::memory_order_relaxed));

    char userMsg[200];
    va_list args;
    va_start(args, fmt);
    vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    snprintf(ringBuffer_[w].message, sizeof(LogEntry::message),
             "[%06ld][RT][%s] %s:%d %s",
             elapsedMs(), levelTag(level), basename(file), line, userMsg);
    ringBuffer_[w].level = static_cast<int>(level);

    ready_[w].store(true, std::memory_order_release);
}

void Logger::drain()
{
    while (true)
    {
        int r = readPos_.load(std::memory_order_relaxed);
        if (r == writePos_.load(std::memory_order_acquire))
            break;

        // Slot claimed but still being written
        if (!ready_[r].load(std::memory_order_acquire))
            break;

        emit(ringBuffer_[r].level, ringBuffer_[r].message);

        ready_[r].store(false, std::memory_order_relaxed);
        readPos_.store((r + 1) % (kRingCapacity + 1), std::memory_order_release);
    }
}

int Logger::droppedCount()
{
    return dropped_.load(std::memory_order_relaxed);
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    callbackUserData_.store(userData, std::memory_order_release);
    callback_.store(callback, std::memory_order_release);
}

} // namespace risset
