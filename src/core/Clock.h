#pragma once

#include <cstdint>

namespace risset {

// Free-running monotonic microsecond counter. Never the wall clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t nowMicros() const = 0;
};

class MonotonicClock : public Clock {
public:
    MonotonicClock();
    int64_t nowMicros() const override;

private:
    int64_t originNanos_;
};

} // namespace risset
