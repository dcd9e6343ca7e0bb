#pragma once

#include "core/AudioBackend.h"
#include "core/Clock.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace risset {

struct VoiceEngineConfig {
    double referencePitchHz = 440.0;
    int numOctaves = 10;
    Waveform waveform = Waveform::triangle;
    double gainHeadroom = 3.5;      // voice gain is divided by this per layer
    double fadeOutMs = 100.0;
    double releaseMarginMs = 50.0;  // extra wait after the fade before disposal
};

struct OctaveLayer {
    AudioBackend::SourceHandle source = 0;
    AudioBackend::VoiceHandle voice = 0;
    double frequencyHz = 0.0;
    float volume = 0.0f;
};

/// One logical note rendered as a stack of octave-spaced oscillators.
/// Owns its backend handles; destroying a Voice that was never passed to
/// VoiceEngine::stop() cuts its layers immediately.
class Voice {
public:
    ~Voice();

    Voice(const Voice&) = delete;
    Voice& operator=(const Voice&) = delete;

    int getPitchClassOffset() const { return pitchClassOffset_; }
    double getGain() const { return gain_; }
    double getTranspose() const { return transpose_; }
    double getTuningCents() const { return tuningCents_; }
    double getTotalSemitones() const;

    int getNumLayers() const { return static_cast<int>(layers_.size()); }
    const OctaveLayer& getLayer(int octave) const { return layers_[static_cast<size_t>(octave)]; }

private:
    friend class VoiceEngine;
    Voice(AudioBackend& backend, int pitchClassOffset, double gain,
          double transpose, double tuningCents);

    void releaseNow();

    AudioBackend& backend_;
    int pitchClassOffset_;
    double gain_;
    double transpose_;
    double tuningCents_;
    std::vector<OctaveLayer> layers_;
};

/// Shepard-Risset voice engine.
///
/// Every layer k of a voice plays at base * 2^k * 2^(semitones/12). Layer
/// volume follows a bell in absolute log-frequency centred on kEnvelopeCenterHz,
/// so moving the pitch class slides all layers under a fixed envelope.
///
/// Control thread only.
class VoiceEngine {
public:
    static constexpr double kEnvelopeCenterHz = 400.0;
    static constexpr double kEnvelopeSpread = 4.2;
    static constexpr float kMaxLayerVolume = 0.6f;

    static double shepardWeight(double frequencyHz);
    static double layerFrequency(double baseFrequencyHz, int octave, double totalSemitones);
    // C0 for a given A4 reference (16.3516 Hz at 440)
    static double baseFrequencyFor(double referencePitchHz);

    VoiceEngine(AudioBackend& backend, Clock& clock, const VoiceEngineConfig& config = {});
    ~VoiceEngine();

    VoiceEngine(const VoiceEngine&) = delete;
    VoiceEngine& operator=(const VoiceEngine&) = delete;

    // All layers start together, looping. Returns nullptr if any layer cannot
    // be created; layers created so far are released.
    std::unique_ptr<Voice> startVoice(int pitchClassOffset, double gain,
                                      double transpose, double tuningCents);

    // Retunes every layer in place: same handles, new frequency and volume.
    void updateFrequencies(Voice& voice, int pitchClassOffset,
                           double transpose, double tuningCents);

    // Fades all layers out; handles are disposed by a later collectReleased().
    void stop(std::unique_ptr<Voice> voice);

    // Disposes voices whose fade has finished. Returns how many were released.
    int collectReleased();
    int getPendingReleaseCount() const { return static_cast<int>(pending_.size()); }

    void setReferencePitch(double referencePitchHz);
    double getBaseFrequency() const { return baseFrequencyHz_; }
    const VoiceEngineConfig& getConfig() const { return config_; }

    float layerVolume(double frequencyHz, double gain) const;

private:
    struct PendingRelease {
        std::unique_ptr<Voice> voice;
        int64_t dueMicros;
    };

    AudioBackend& backend_;
    Clock& clock_;
    VoiceEngineConfig config_;
    double baseFrequencyHz_;
    std::vector<PendingRelease> pending_;
};

} // namespace risset
