#include "core/SettingsStore.h"
#include "core/BeatScheduler.h"
#include "core/Logger.h"

#include <algorithm>

namespace risset {

namespace {

constexpr const char* kReferencePitchKey = "a4Ref";
constexpr const char* kTransposeKey = "transpose";
constexpr const char* kTuningKey = "tuning";
constexpr const char* kBpmKey = "bpm";
constexpr const char* kBeatsKey = "beatsPerMeasure";
constexpr const char* kGlobalVolumeKey = "globalVolume";

const char* offsetKey(FeedbackChannel channel)
{
    switch (channel) {
        case FeedbackChannel::sound:     return "soundOffsetMs";
        case FeedbackChannel::haptic:    return "hapticOffsetMs";
        case FeedbackChannel::vibration: return "vibrationOffsetMs";
        case FeedbackChannel::flash:     return "flashOffsetMs";
    }
    return "soundOffsetMs";
}

} // namespace

SettingsStore::SettingsStore()
    : properties_(false)
{
}

int SettingsStore::getClampedInt(const char* key, int fallback, int lo, int hi) const
{
    return std::clamp(properties_.getIntValue(key, fallback), lo, hi);
}

void SettingsStore::setInt(const char* key, int value)
{
    properties_.setValue(key, value);
    RS_DEBUG("SettingsStore: %s=%d", key, value);
}

int SettingsStore::getReferencePitch() const
{
    return getClampedInt(kReferencePitchKey, 440, kMinReferencePitch, kMaxReferencePitch);
}

void SettingsStore::setReferencePitch(int hz)
{
    setInt(kReferencePitchKey, std::clamp(hz, kMinReferencePitch, kMaxReferencePitch));
}

int SettingsStore::getTranspose() const
{
    return getClampedInt(kTransposeKey, 0, kMinTranspose, kMaxTranspose);
}

void SettingsStore::setTranspose(int semitones)
{
    setInt(kTransposeKey, std::clamp(semitones, kMinTranspose, kMaxTranspose));
}

int SettingsStore::getTuningCents() const
{
    return getClampedInt(kTuningKey, 0, kMinTuningCents, kMaxTuningCents);
}

void SettingsStore::setTuningCents(int cents)
{
    setInt(kTuningKey, std::clamp(cents, kMinTuningCents, kMaxTuningCents));
}

int SettingsStore::getBpm() const
{
    return getClampedInt(kBpmKey, 120, BeatScheduler::kMinBpm, BeatScheduler::kMaxBpm);
}

void SettingsStore::setBpm(int bpm)
{
    setInt(kBpmKey, BeatScheduler::clampBpm(bpm));
}

int SettingsStore::getBeatsPerMeasure() const
{
    return getClampedInt(kBeatsKey, 4, BeatScheduler::kMinBeatsPerMeasure,
                         BeatScheduler::kMaxBeatsPerMeasure);
}

void SettingsStore::setBeatsPerMeasure(int beats)
{
    setInt(kBeatsKey, BeatScheduler::clampBeatsPerMeasure(beats));
}

double SettingsStore::getGlobalVolume() const
{
    return std::clamp(properties_.getDoubleValue(kGlobalVolumeKey, 1.0), 0.0, kMaxGlobalVolume);
}

void SettingsStore::setGlobalVolume(double volume)
{
    double clamped = std::clamp(volume, 0.0, kMaxGlobalVolume);
    properties_.setValue(kGlobalVolumeKey, clamped);
    RS_DEBUG("SettingsStore: %s=%.3f", kGlobalVolumeKey, clamped);
}

int SettingsStore::getChannelOffsetMs(FeedbackChannel channel) const
{
    return getClampedInt(offsetKey(channel), 0, kMinOffsetMs, kMaxOffsetMs);
}

void SettingsStore::setChannelOffsetMs(FeedbackChannel channel, int offsetMs)
{
    setInt(offsetKey(channel), std::clamp(offsetMs, kMinOffsetMs, kMaxOffsetMs));
}

} // namespace risset
