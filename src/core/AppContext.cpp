#include "core/AppContext.h"
#include "core/Logger.h"

#include <cmath>

namespace risset {

void CallbackFeedbackSink::setCallback(FeedbackCallback callback, void* userData)
{
    userData_.store(userData, std::memory_order_release);
    callback_.store(callback, std::memory_order_release);
}

void CallbackFeedbackSink::fire(int trackId, const FeedbackPulse& pulse)
{
    auto callback = callback_.load(std::memory_order_acquire);
    if (!callback)
        return;
    callback(trackId, static_cast<int>(pulse.channel), static_cast<int>(pulse.strength),
             pulse.amplitude, pulse.durationMs, userData_.load(std::memory_order_acquire));
}

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

AppContext::AppContext()
    : tuner_(settings_.getReferencePitch())
{
    audio_.setGlobalVolume(static_cast<float>(settings_.getGlobalVolume()));

    VoiceEngineConfig voiceConfig;
    voiceConfig.referencePitchHz = settings_.getReferencePitch();
    voiceEngine_ = std::make_unique<VoiceEngine>(audio_, clock_, voiceConfig);

    voices_ = std::make_unique<VoiceGroupManager>(*voiceEngine_);
    voices_->setTranspose(settings_.getTranspose());
    voices_->setTuningCents(settings_.getTuningCents());

    tracks_ = std::make_unique<TrackCoordinator>(clock_, audio_, feedbackSink_, settings_);

    TrackConfig main;
    main.name = "A";
    main.bpm = settings_.getBpm();
    main.beatsPerMeasure = settings_.getBeatsPerMeasure();
    main.persistToSettings = true;
    main.strongClick = makeClick("A strong", 1760.0, 40.0);
    main.weakClick = makeClick("A weak", 1320.0, 30.0);
    clicks_[kMainTrack] = {main.strongClick, main.weakClick};
    tracks_->addTrack(main);

    TrackConfig secondary;
    secondary.name = "B";
    secondary.bpm = 120;
    secondary.beatsPerMeasure = 3;
    secondary.muted = true;
    secondary.strongClick = makeClick("B strong", 1100.0, 40.0);
    secondary.weakClick = makeClick("B weak", 880.0, 30.0);
    clicks_[kSecondaryTrack] = {secondary.strongClick, secondary.weakClick};
    tracks_->addTrack(secondary);

    RS_INFO("AppContext: created with %d tracks", tracks_->getTrackCount());
}

AppContext::~AppContext()
{
    tracks_.reset();
    voices_.reset();
    voiceEngine_.reset();
    audio_.stop();
    Logger::drain();
    RS_INFO("AppContext: destroyed");
}

// Short exponentially decaying sine burst
AudioBackend::SampleId AppContext::makeClick(const char* name, double frequencyHz, double lengthMs)
{
    constexpr double kClickSampleRate = 44100.0;
    int numSamples = static_cast<int>(kClickSampleRate * lengthMs / 1000.0);
    double decay = lengthMs / 5000.0;

    juce::AudioBuffer<float> data(1, numSamples);
    float* out = data.getWritePointer(0);
    for (int i = 0; i < numSamples; ++i)
    {
        double t = i / kClickSampleRate;
        out[i] = static_cast<float>(std::sin(juce::MathConstants<double>::twoPi * frequencyHz * t)
                                    * std::exp(-t / decay));
    }
    return audio_.addSample(std::move(data), kClickSampleRate, name);
}

// ═══════════════════════════════════════════════════════════════════
// Settings fan-out
// ═══════════════════════════════════════════════════════════════════

void AppContext::setReferencePitch(int hz)
{
    settings_.setReferencePitch(hz);
    int applied = settings_.getReferencePitch();
    voices_->setReferencePitch(applied);
    tuner_.setReferencePitch(applied);
}

void AppContext::setTranspose(int semitones)
{
    settings_.setTranspose(semitones);
    voices_->setTranspose(settings_.getTranspose());
}

void AppContext::setTuningCents(int cents)
{
    settings_.setTuningCents(cents);
    voices_->setTuningCents(settings_.getTuningCents());
}

void AppContext::setGlobalVolume(double volume)
{
    settings_.setGlobalVolume(volume);
    audio_.setGlobalVolume(static_cast<float>(settings_.getGlobalVolume()));
}

void AppContext::setChannelOffsetMs(FeedbackChannel channel, int offsetMs)
{
    settings_.setChannelOffsetMs(channel, offsetMs);
    int applied = settings_.getChannelOffsetMs(channel);
    for (int id = 0; id < tracks_->getTrackCount(); ++id)
        tracks_->setChannelOffsetMs(id, channel, applied);
}

bool AppContext::loadClick(int trackId, bool strong, const std::string& path, std::string& error)
{
    if (trackId < 0 || trackId >= tracks_->getTrackCount())
    {
        error = "Unknown track " + std::to_string(trackId);
        return false;
    }

    AudioBackend::SampleId id = audio_.loadSample(path, error);
    if (id < 0)
        return false;

    auto& clicks = clicks_[static_cast<size_t>(trackId)];
    auto& slot = strong ? clicks.strong : clicks.weak;
    AudioBackend::SampleId replaced = slot;
    slot = id;
    if (!tracks_->setClicks(trackId, clicks.strong, clicks.weak))
        return false;

    // The strong and weak clicks may share a sample
    if (replaced >= 0 && replaced != clicks.strong && replaced != clicks.weak)
        audio_.releaseSample(replaced);
    return true;
}

int AppContext::poll()
{
    Logger::drain();
    return voiceEngine_->collectReleased();
}

} // namespace risset
