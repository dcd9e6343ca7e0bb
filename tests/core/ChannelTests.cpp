#include <catch2/catch_test_macros.hpp>
#include "core/Channel.h"

#include <chrono>
#include <thread>
#include <vector>

using risset::Channel;
using risset::Semaphore;

TEST_CASE("Channel: send one message and receive it")
{
    Channel<int, 4> ch;
    REQUIRE(ch.send(42));
    int out = 0;
    REQUIRE(ch.tryReceive(out));
    REQUIRE(out == 42);
}

TEST_CASE("Channel: receive on empty channel returns false")
{
    Channel<int, 4> ch;
    int out = 0;
    REQUIRE_FALSE(ch.tryReceive(out));
    REQUIRE_FALSE(ch.hasPending());
}

TEST_CASE("Channel: size tracks sends and receives")
{
    Channel<int, 4> ch;
    REQUIRE(ch.size() == 0);
    ch.send(1);
    ch.send(2);
    ch.send(3);
    REQUIRE(ch.size() == 3);
    int out;
    ch.tryReceive(out);
    REQUIRE(ch.size() == 2);
    REQUIRE(ch.hasPending());
}

TEST_CASE("Channel: send fails when full and nothing is overwritten")
{
    Channel<int, 4> ch;
    for (int i = 0; i < 4; ++i)
        REQUIRE(ch.send(i));
    REQUIRE_FALSE(ch.send(99));
    REQUIRE(ch.size() == ch.capacity());

    int out = -1;
    REQUIRE(ch.tryReceive(out));
    REQUIRE(out == 0);
}

TEST_CASE("Channel: messages arrive in order across wrap-around")
{
    Channel<int, 3> ch;
    std::vector<int> received;
    for (int round = 0; round < 5; ++round)
    {
        ch.send(round * 2);
        ch.send(round * 2 + 1);
        ch.receiveAll([&](int v) { received.push_back(v); });
    }
    REQUIRE(received.size() == 10);
    for (int i = 0; i < 10; ++i)
        REQUIRE(received[static_cast<size_t>(i)] == i);
}

TEST_CASE("Channel: receiveAll returns the number handled")
{
    Channel<int, 8> ch;
    ch.send(1);
    ch.send(2);
    int sum = 0;
    REQUIRE(ch.receiveAll([&](int v) { sum += v; }) == 2);
    REQUIRE(sum == 3);
    REQUIRE(ch.receiveAll([&](int) {}) == 0);
}

TEST_CASE("Channel: waitFor times out with nothing sent")
{
    Channel<int, 4> ch;
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(ch.waitFor(std::chrono::milliseconds(20)));
    REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(15));
}

TEST_CASE("Channel: send wakes a waiting consumer early")
{
    Channel<int, 4> ch;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ch.send(7);
    });

    auto start = std::chrono::steady_clock::now();
    REQUIRE(ch.waitFor(std::chrono::seconds(5)));
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    producer.join();

    int out = 0;
    REQUIRE(ch.tryReceive(out));
    REQUIRE(out == 7);
}

TEST_CASE("Channel: several channels can share one semaphore")
{
    Semaphore shared;
    Channel<int, 4> a(&shared);
    Channel<int, 4> b(&shared);

    b.send(5);
    REQUIRE(shared.waitFor(std::chrono::milliseconds(100)));
    int out = 0;
    REQUIRE_FALSE(a.tryReceive(out));
    REQUIRE(b.tryReceive(out));
    REQUIRE(out == 5);
}

TEST_CASE("Channel: a NoSignal channel is polled only")
{
    Channel<int, 8> ch{risset::NoSignal{}};
    CHECK_FALSE(ch.waitFor(std::chrono::microseconds(1000)));

    for (int round = 0; round < 1000; ++round)
    {
        REQUIRE(ch.send(round));
        CHECK(ch.waitFor(std::chrono::microseconds(0)));
        int out = -1;
        REQUIRE(ch.tryReceive(out));
        REQUIRE(out == round);
    }

    // No wake-ups were banked by the sends above
    ch.wait();
    CHECK_FALSE(ch.waitFor(std::chrono::microseconds(1000)));
}

TEST_CASE("Channel: concurrent producers lose nothing")
{
    Channel<int, 1024> ch;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back([&ch, p] {
            for (int i = 0; i < kPerProducer; ++i)
                while (!ch.send(p * kPerProducer + i))
                    std::this_thread::yield();
        });
    }

    std::vector<int> lastSeen(kProducers, -1);
    int received = 0;
    bool ordered = true;
    while (received < kProducers * kPerProducer)
    {
        int v;
        if (!ch.tryReceive(v))
        {
            std::this_thread::yield();
            continue;
        }
        int producer = v / kPerProducer;
        if (v <= lastSeen[static_cast<size_t>(producer)])
            ordered = false;
        lastSeen[static_cast<size_t>(producer)] = v;
        ++received;
    }
    for (auto& t : producers)
        t.join();

    REQUIRE(received == kProducers * kPerProducer);
    REQUIRE(ordered);
}
