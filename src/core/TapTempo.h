#pragma once

#include <array>
#include <cstdint>

namespace risset {

/// Tap-tempo estimator over the most recent kMaxTaps tap timestamps.
class TapTempo {
public:
    static constexpr int kMaxTaps = 8;

    // Records a tap. Returns the estimated bpm (clamped to the scheduler
    // range) once two or more taps are held, 0 otherwise.
    int tap(int64_t tapMicros);

    void reset();
    int size() const { return count_; }

    // Oldest first; index < size()
    int64_t tapAt(int index) const;

private:
    std::array<int64_t, kMaxTaps> taps_{};
    int head_ = 0;  // slot of the oldest tap
    int count_ = 0;
};

} // namespace risset
