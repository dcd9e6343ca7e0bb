#pragma once

#include "core/Feedback.h"

#include <juce_core/juce_core.h>

namespace risset {

/// Typed, in-memory user settings.
///
/// Backed by juce::PropertySet, which is internally locked, so getters and
/// setters may be called from any thread. Values are clamped on write and on
/// read. Nothing is persisted.
class SettingsStore {
public:
    static constexpr int kMinReferencePitch = 410;
    static constexpr int kMaxReferencePitch = 480;
    static constexpr int kMinTranspose = -12;
    static constexpr int kMaxTranspose = 12;
    static constexpr int kMinTuningCents = -100;
    static constexpr int kMaxTuningCents = 100;
    static constexpr int kMinOffsetMs = -20;
    static constexpr int kMaxOffsetMs = 50;
    static constexpr double kMaxGlobalVolume = 2.0;

    SettingsStore();

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    // A4 reference, Hz
    int getReferencePitch() const;
    void setReferencePitch(int hz);

    int getTranspose() const;
    void setTranspose(int semitones);

    int getTuningCents() const;
    void setTuningCents(int cents);

    int getBpm() const;
    void setBpm(int bpm);

    int getBeatsPerMeasure() const;
    void setBeatsPerMeasure(int beats);

    double getGlobalVolume() const;
    void setGlobalVolume(double volume);

    int getChannelOffsetMs(FeedbackChannel channel) const;
    void setChannelOffsetMs(FeedbackChannel channel, int offsetMs);

private:
    int getClampedInt(const char* key, int fallback, int lo, int hi) const;
    void setInt(const char* key, int value);

    juce::PropertySet properties_;
};

} // namespace risset
