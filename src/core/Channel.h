#pragma once

#include "core/Semaphore.h"

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>

namespace risset {

// Bounded, ordered message channel between two execution contexts.
//
// Any number of producers may send(); a single consumer receives. Messages are
// copied in and out by value, so nothing is shared by reference across the
// boundary. Producers serialize on a mutex; the consumer side is lock-free.
//
// A channel signals either its own semaphore or one supplied by the consumer,
// which lets one consumer thread block on several channels at once. A channel
// built with NoSignal is polled only and posts nothing.
struct NoSignal {};

template<typename T, int Capacity>
class Channel {
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    Channel() : signal_(&ownSignal_) {}
    explicit Channel(Semaphore* signal) : signal_(signal ? signal : &ownSignal_) {}
    explicit Channel(NoSignal) : signal_(nullptr) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // --- Producer side ---
    bool send(const T& message)
    {
        {
            std::lock_guard<std::mutex> lock(producerMutex_);
            int write = writePos_.load(std::memory_order_relaxed);
            int nextWrite = next(write);
            if (nextWrite == readPos_.load(std::memory_order_acquire))
                return false;
            buffer_[write] = message;
            writePos_.store(nextWrite, std::memory_order_release);
        }
        if (signal_)
            signal_->post();
        return true;
    }

    // --- Consumer side ---
    bool tryReceive(T& message)
    {
        int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        message = buffer_[read];
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    template<typename Handler>
    int receiveAll(Handler&& handler)
    {
        int count = 0;
        T message;
        while (tryReceive(message)) {
            handler(message);
            ++count;
        }
        return count;
    }

    // Blocks until something was sent or the timeout expires. A true return
    // does not promise a message is queued: the signal may be shared.
    // Without a signal these only report whether a message is pending.
    bool waitFor(std::chrono::microseconds timeout)
    {
        return signal_ ? signal_->waitFor(timeout) : hasPending();
    }

    void wait()
    {
        if (signal_)
            signal_->wait();
    }

    bool hasPending() const
    {
        return readPos_.load(std::memory_order_acquire)
            != writePos_.load(std::memory_order_acquire);
    }

    int size() const
    {
        int write = writePos_.load(std::memory_order_acquire);
        int read = readPos_.load(std::memory_order_acquire);
        int diff = write - read;
        return diff >= 0 ? diff : diff + (Capacity + 1);
    }

    static constexpr int capacity() { return Capacity; }

private:
    static int next(int pos) { return (pos + 1) % (Capacity + 1); }

    std::array<T, Capacity + 1> buffer_{};
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};
    std::mutex producerMutex_;

    Semaphore ownSignal_;
    Semaphore* signal_;
};

} // namespace risset
