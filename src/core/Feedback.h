#pragma once

namespace risset {

enum class FeedbackChannel : int { sound = 0, haptic = 1, vibration = 2, flash = 3 };

static constexpr int kFeedbackChannelCount = 4;

enum class FeedbackStrength : int { weak = 0, strong = 1 };

inline const char* feedbackChannelName(FeedbackChannel channel)
{
    switch (channel) {
        case FeedbackChannel::sound:     return "sound";
        case FeedbackChannel::haptic:    return "haptic";
        case FeedbackChannel::vibration: return "vibration";
        case FeedbackChannel::flash:     return "flash";
    }
    return "unknown";
}

// Physical shape of one feedback pulse, as handed to the actuator hook.
struct FeedbackPulse {
    FeedbackChannel channel = FeedbackChannel::haptic;
    FeedbackStrength strength = FeedbackStrength::weak;
    float amplitude = 0.0f;  // 0..1
    int durationMs = 0;
};

// Strong variants on the downbeat are heavier and longer.
inline FeedbackPulse pulseFor(FeedbackChannel channel, FeedbackStrength strength)
{
    bool strong = strength == FeedbackStrength::strong;
    FeedbackPulse pulse;
    pulse.channel = channel;
    pulse.strength = strength;
    switch (channel) {
        case FeedbackChannel::sound:
            pulse.amplitude = strong ? 0.09f : 0.06f;
            break;
        case FeedbackChannel::haptic:
            pulse.amplitude = strong ? 1.0f : 0.4f;
            pulse.durationMs = strong ? 20 : 10;
            break;
        case FeedbackChannel::vibration:
            pulse.amplitude = strong ? 1.0f : 0.5f;
            pulse.durationMs = strong ? 60 : 30;
            break;
        case FeedbackChannel::flash:
            pulse.amplitude = 1.0f;
            pulse.durationMs = strong ? 50 : 25;
            break;
    }
    return pulse;
}

/// Haptic, vibration and light actuators. Called from the coordinator's
/// dispatch thread; implementations must not block for long.
class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;
    virtual void fire(int trackId, const FeedbackPulse& pulse) = 0;
};

} // namespace risset
