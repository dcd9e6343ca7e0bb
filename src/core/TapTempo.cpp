#include "core/TapTempo.h"
#include "core/BeatScheduler.h"
#include "core/Logger.h"

#include <cmath>

namespace risset {

int TapTempo::tap(int64_t tapMicros)
{
    if (count_ < kMaxTaps)
    {
        taps_[(head_ + count_) % kMaxTaps] = tapMicros;
        ++count_;
    }
    else
    {
        // Full: overwrite the oldest
        taps_[head_] = tapMicros;
        head_ = (head_ + 1) % kMaxTaps;
    }

    if (count_ < 2)
        return 0;

    // Mean of successive intervals telescopes to (newest - oldest) / (n - 1)
    double spanMs = static_cast<double>(tapAt(count_ - 1) - tapAt(0)) / 1000.0;
    double meanMs = spanMs / (count_ - 1);
    if (meanMs <= 0.0)
    {
        RS_DEBUG("TapTempo::tap: non-increasing taps, ignoring");
        return 0;
    }

    int bpm = BeatScheduler::clampBpm(static_cast<int>(std::lround(60000.0 / meanMs)));
    RS_DEBUG("TapTempo::tap: %d taps, mean %.2f ms -> %d bpm", count_, meanMs, bpm);
    return bpm;
}

void TapTempo::reset()
{
    head_ = 0;
    count_ = 0;
}

int64_t TapTempo::tapAt(int index) const
{
    return taps_[(head_ + index) % kMaxTaps];
}

} // namespace risset
