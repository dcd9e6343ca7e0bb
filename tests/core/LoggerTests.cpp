#include <catch2/catch_test_macros.hpp>

#include "core/Logger.h"

#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace risset;

// --- Callback test helpers ---

struct CapturedLog {
    int level;
    std::string message;
};

static std::vector<CapturedLog> g_captured;

static void captureCallback(int level, const char* message, void* /*userData*/)
{
    g_captured.push_back({level, message});
}

static void resetLogger()
{
    Logger::setCallback(nullptr, nullptr);
    Logger::setLevel(LogLevel::warn);
    Logger::drain(); // flush any leftover RT entries
    g_captured.clear();
}

// --- Level tests ---

TEST_CASE("Logger default level is warn")
{
    resetLogger();
    REQUIRE(Logger::getLevel() == LogLevel::warn);
}

TEST_CASE("Logger setLevel and getLevel agree for every level")
{
    resetLogger();

    for (auto level : {LogLevel::off, LogLevel::warn, LogLevel::info,
                       LogLevel::debug, LogLevel::trace})
    {
        Logger::setLevel(level);
        REQUIRE(Logger::getLevel() == level);
    }

    resetLogger();
}

// --- Control-thread macros ---

TEST_CASE("RS_WARN fires at warn level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    RS_WARN("warn msg %d", 42);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[warn]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("warn msg 42") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));

    resetLogger();
}

TEST_CASE("RS_WARN is a no-op when level is off")
{
    resetLogger();
    Logger::setLevel(LogLevel::off);
    Logger::setCallback(captureCallback, nullptr);

    RS_WARN("should not appear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("RS_INFO is suppressed at warn level and fires at info")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    RS_INFO("hidden");
    REQUIRE(g_captured.empty());

    Logger::setLevel(LogLevel::info);
    RS_INFO("info msg %d", 7);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[info]") != std::string::npos);

    resetLogger();
}

TEST_CASE("RS_TRACE is suppressed at debug level")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    RS_DEBUG("debug msg");
    RS_TRACE("should not appear");
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[debug]") != std::string::npos);

    resetLogger();
}

// --- Timing-thread macros ---

TEST_CASE("RS_WARN_RT pushes entry and drain writes it")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    RS_WARN_RT("rt warn %d", 77);
    REQUIRE(g_captured.empty()); // not yet drained

    Logger::drain();
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[RT]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("[warn]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("rt warn 77") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));

    resetLogger();
}

TEST_CASE("RS_DEBUG_RT is suppressed at warn level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    RS_DEBUG_RT("should not appear");
    Logger::drain();
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("callback receives correct level for RT drain")
{
    resetLogger();
    Logger::setLevel(LogLevel::trace);
    Logger::setCallback(captureCallback, nullptr);

    RS_WARN_RT("w");
    RS_INFO_RT("i");
    RS_DEBUG_RT("d");
    RS_TRACE_RT("t");
    Logger::drain();

    REQUIRE(g_captured.size() == 4);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));
    REQUIRE(g_captured[1].level == static_cast<int>(LogLevel::info));
    REQUIRE(g_captured[2].level == static_cast<int>(LogLevel::debug));
    REQUIRE(g_captured[3].level == static_cast<int>(LogLevel::trace));

    resetLogger();
}

// --- Message format ---

TEST_CASE("CT log message contains timestamp, CT tag, level, file and text")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    RS_DEBUG("format test %d", 123);
    REQUIRE(g_captured.size() == 1);

    const auto& msg = g_captured[0].message;
    REQUIRE(msg[0] == '[');
    REQUIRE(msg.find("[CT]") != std::string::npos);
    REQUIRE(msg.find("LoggerTests.cpp") != std::string::npos);
    REQUIRE(msg.find("format test 123") != std::string::npos);
    // basename only
    REQUIRE(msg.find("tests/core") == std::string::npos);

    resetLogger();
}

TEST_CASE("setCallback nullptr reverts to stderr")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);
    Logger::setCallback(nullptr, nullptr);

    RS_DEBUG("after clear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

// --- Edge cases ---

TEST_CASE("Drain on empty queue is safe")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);
    Logger::drain();
    Logger::drain();
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("RT queue overflow drops and counts the excess")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    int droppedBefore = Logger::droppedCount();

    for (int i = 0; i < 2000; ++i)
        Logger::logRT(LogLevel::debug, __FILE__, __LINE__, "overflow test %d", i);

    Logger::setCallback(captureCallback, nullptr);
    Logger::drain();

    REQUIRE(g_captured.size() == 1024);
    REQUIRE(Logger::droppedCount() - droppedBefore == 2000 - 1024);
    // Oldest entries survive
    REQUIRE(g_captured.front().message.find("overflow test 0") != std::string::npos);

    resetLogger();
}

TEST_CASE("Long messages are truncated safely")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    char longMsg[1024];
    memset(longMsg, 'A', sizeof(longMsg) - 1);
    longMsg[sizeof(longMsg) - 1] = '\0';

    RS_DEBUG("%s", longMsg);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.size() <= 512);

    g_captured.clear();

    RS_DEBUG_RT("%s", longMsg);
    Logger::drain();
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.size() <= 512);

    resetLogger();
}

TEST_CASE("RT logs from several threads all drain")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i)
                RS_DEBUG_RT("thread %d entry %d", t, i);
        });
    }
    for (auto& th : threads)
        th.join();

    Logger::setCallback(captureCallback, nullptr);
    Logger::drain();
    REQUIRE(g_captured.size() == static_cast<size_t>(kThreads * kPerThread));

    // Per-thread order is kept
    for (int t = 0; t < kThreads; ++t)
    {
        std::string prefix = "thread " + std::to_string(t) + " entry ";
        int expected = 0;
        for (const auto& entry : g_captured)
        {
            auto pos = entry.message.find(prefix);
            if (pos == std::string::npos)
                continue;
            REQUIRE(std::stoi(entry.message.substr(pos + prefix.size())) == expected);
            ++expected;
        }
        REQUIRE(expected == kPerThread);
    }

    resetLogger();
}

TEST_CASE("Multiple RT logs drain in order")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    RS_DEBUG_RT("first");
    RS_DEBUG_RT("second");
    RS_DEBUG_RT("third");
    Logger::drain();

    REQUIRE(g_captured.size() == 3);
    REQUIRE(g_captured[0].message.find("first") != std::string::npos);
    REQUIRE(g_captured[1].message.find("second") != std::string::npos);
    REQUIRE(g_captured[2].message.find("third") != std::string::npos);

    resetLogger();
}
