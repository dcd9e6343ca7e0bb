#include "core/Clock.h"

#include <chrono>

namespace risset {

static int64_t steadyNanos()
{
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

MonotonicClock::MonotonicClock()
    : originNanos_(steadyNanos())
{
}

int64_t MonotonicClock::nowMicros() const
{
    return (steadyNanos() - originNanos_) / 1000;
}

} // namespace risset
