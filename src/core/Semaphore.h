#pragma once

#include <chrono>
#include <cstdint>

#ifdef __APPLE__
#include <dispatch/dispatch.h>
#else
#include <condition_variable>
#include <mutex>
#endif

namespace risset {

// Counting semaphore used as the wake-up half of a Channel.
// waitFor() doubles as the scheduler's cancellable coarse sleep: any post()
// ends the sleep early.
class Semaphore {
public:
#ifdef __APPLE__
    Semaphore()  { sem_ = dispatch_semaphore_create(0); }
    ~Semaphore() { dispatch_release(sem_); }

    void post() { dispatch_semaphore_signal(sem_); }

    void wait() { dispatch_semaphore_wait(sem_, DISPATCH_TIME_FOREVER); }

    // Returns true if woken by post(), false on timeout
    bool waitFor(std::chrono::microseconds timeout)
    {
        if (timeout.count() <= 0)
            return dispatch_semaphore_wait(sem_, DISPATCH_TIME_NOW) == 0;
        auto deadline = dispatch_time(DISPATCH_TIME_NOW,
                                      static_cast<int64_t>(timeout.count()) * 1000);
        return dispatch_semaphore_wait(sem_, deadline) == 0;
    }

private:
    dispatch_semaphore_t sem_;
#else
    Semaphore() = default;
    ~Semaphore() = default;

    void post()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
        cv_.notify_one();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return count_ > 0; });
        --count_;
    }

    bool waitFor(std::chrono::microseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return count_ > 0; }))
            return false;
        --count_;
        return true;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_ = 0;
#endif

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
};

} // namespace risset
