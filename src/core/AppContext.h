#pragma once

#include "core/Clock.h"
#include "core/Feedback.h"
#include "core/JuceAudioBackend.h"
#include "core/SettingsStore.h"
#include "core/TrackCoordinator.h"
#include "core/Tuner.h"
#include "core/VoiceEngine.h"
#include "core/VoiceGroupManager.h"

#include <array>
#include <atomic>
#include <memory>
#include <string>

namespace risset {

// Host hook for the non-audio feedback channels (dispatch thread)
using FeedbackCallback = void(*)(int trackId, int channel, int strength,
                                 float amplitude, int durationMs, void* userData);

// Forwards FeedbackSink::fire to a host callback, if one is set.
class CallbackFeedbackSink : public FeedbackSink {
public:
    void setCallback(FeedbackCallback callback, void* userData);
    void fire(int trackId, const FeedbackPulse& pulse) override;

private:
    std::atomic<FeedbackCallback> callback_{nullptr};
    std::atomic<void*> userData_{nullptr};
};

/// Everything the application shares, created once by the host.
///
/// Construction order is the dependency order: settings, clock and audio
/// first, then the voice engine and the tracks on top of them. Track 0 is the
/// main metronome (persists tempo to settings); track 1 the secondary one.
class AppContext {
public:
    static constexpr int kMainTrack = 0;
    static constexpr int kSecondaryTrack = 1;

    AppContext();
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    SettingsStore& getSettings() { return settings_; }
    Clock& getClock() { return clock_; }
    JuceAudioBackend& getAudio() { return audio_; }
    VoiceEngine& getVoiceEngine() { return *voiceEngine_; }
    VoiceGroupManager& getVoices() { return *voices_; }
    TrackCoordinator& getTracks() { return *tracks_; }
    TunerReading& getTuner() { return tuner_; }
    CallbackFeedbackSink& getFeedbackSink() { return feedbackSink_; }

    // Applies a setting change to every subsystem that depends on it
    void setReferencePitch(int hz);
    void setTranspose(int semitones);
    void setTuningCents(int cents);
    void setGlobalVolume(double volume);
    void setChannelOffsetMs(FeedbackChannel channel, int offsetMs);

    // Replaces a track's strong or weak click with an audio file.
    bool loadClick(int trackId, bool strong, const std::string& path, std::string& error);

    // Control-thread housekeeping: drains timing-thread logs and releases
    // voices whose fade has finished. Returns the number of voices released.
    int poll();

private:
    struct TrackClicks {
        AudioBackend::SampleId strong = -1;
        AudioBackend::SampleId weak = -1;
    };

    AudioBackend::SampleId makeClick(const char* name, double frequencyHz, double lengthMs);

    SettingsStore settings_;
    MonotonicClock clock_;
    JuceAudioBackend audio_;
    CallbackFeedbackSink feedbackSink_;
    TunerReading tuner_;
    std::unique_ptr<VoiceEngine> voiceEngine_;
    std::unique_ptr<VoiceGroupManager> voices_;
    std::unique_ptr<TrackCoordinator> tracks_;
    std::array<TrackClicks, TrackCoordinator::kMaxTracks> clicks_{};
};

} // namespace risset
