#include "core/VoiceEngine.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace risset {

// ═══════════════════════════════════════════════════════════════════
// Voice
// ═══════════════════════════════════════════════════════════════════

Voice::Voice(AudioBackend& backend, int pitchClassOffset, double gain,
             double transpose, double tuningCents)
    : backend_(backend)
    , pitchClassOffset_(pitchClassOffset)
    , gain_(gain)
    , transpose_(transpose)
    , tuningCents_(tuningCents)
{
}

Voice::~Voice()
{
    releaseNow();
}

double Voice::getTotalSemitones() const
{
    return pitchClassOffset_ + transpose_ + tuningCents_ / 100.0;
}

void Voice::releaseNow()
{
    for (auto& layer : layers_)
    {
        // Already-silent layers may reject stop/dispose; the sound is over
        // either way, so this is logged and otherwise ignored.
        if (layer.voice != 0 && !backend_.stop(layer.voice))
            RS_DEBUG("Voice: stop rejected for voice handle %u", layer.voice);
        if (layer.source != 0 && !backend_.dispose(layer.source))
            RS_WARN("Voice: dispose failed for source handle %u", layer.source);
    }
    layers_.clear();
}

// ═══════════════════════════════════════════════════════════════════
// Envelope math
// ═══════════════════════════════════════════════════════════════════

double VoiceEngine::shepardWeight(double frequencyHz)
{
    if (frequencyHz <= 0.0)
        return 0.0;
    double x = std::log2(frequencyHz / kEnvelopeCenterHz) / kEnvelopeSpread;
    double x2 = x * x;
    return std::exp(-(x2 * x2));
}

double VoiceEngine::layerFrequency(double baseFrequencyHz, int octave, double totalSemitones)
{
    return baseFrequencyHz * std::exp2(static_cast<double>(octave))
         * std::exp2(totalSemitones / 12.0);
}

double VoiceEngine::baseFrequencyFor(double referencePitchHz)
{
    // A4 is 57 semitones above C0
    return referencePitchHz * std::exp2(-57.0 / 12.0);
}

float VoiceEngine::layerVolume(double frequencyHz, double gain) const
{
    double v = shepardWeight(frequencyHz) * gain / config_.gainHeadroom;
    return static_cast<float>(std::clamp(v, 0.0, static_cast<double>(kMaxLayerVolume)));
}

// ═══════════════════════════════════════════════════════════════════
// VoiceEngine
// ═══════════════════════════════════════════════════════════════════

VoiceEngine::VoiceEngine(AudioBackend& backend, Clock& clock, const VoiceEngineConfig& config)
    : backend_(backend)
    , clock_(clock)
    , config_(config)
    , baseFrequencyHz_(baseFrequencyFor(config.referencePitchHz))
{
    if (config_.numOctaves < 1)
        config_.numOctaves = 1;
    if (config_.gainHeadroom <= 0.0)
        config_.gainHeadroom = 1.0;
    RS_INFO("VoiceEngine: created, %d octaves, base %.4f Hz",
            config_.numOctaves, baseFrequencyHz_);
}

VoiceEngine::~VoiceEngine()
{
    // Voice destructors cut whatever is still fading
    RS_DEBUG("VoiceEngine: destroying with %d pending releases",
             static_cast<int>(pending_.size()));
    pending_.clear();
}

void VoiceEngine::setReferencePitch(double referencePitchHz)
{
    if (referencePitchHz <= 0.0)
    {
        RS_WARN("VoiceEngine::setReferencePitch: invalid %.2f Hz", referencePitchHz);
        return;
    }
    config_.referencePitchHz = referencePitchHz;
    baseFrequencyHz_ = baseFrequencyFor(referencePitchHz);
    RS_DEBUG("VoiceEngine::setReferencePitch: a4=%.2f base=%.4f",
             referencePitchHz, baseFrequencyHz_);
}

std::unique_ptr<Voice> VoiceEngine::startVoice(int pitchClassOffset, double gain,
                                               double transpose, double tuningCents)
{
    std::unique_ptr<Voice> voice(new Voice(backend_, pitchClassOffset, gain,
                                           transpose, tuningCents));
    double semitones = voice->getTotalSemitones();

    // Create every source first so that playback starts together
    voice->layers_.resize(static_cast<size_t>(config_.numOctaves));
    for (int k = 0; k < config_.numOctaves; ++k)
    {
        auto& layer = voice->layers_[static_cast<size_t>(k)];
        layer.frequencyHz = layerFrequency(baseFrequencyHz_, k, semitones);
        layer.volume = layerVolume(layer.frequencyHz, gain);
        layer.source = backend_.createOscillator(config_.waveform, layer.frequencyHz);
        if (layer.source == 0)
        {
            RS_WARN("VoiceEngine::startVoice: oscillator %d of %d failed", k, config_.numOctaves);
            return nullptr; // ~Voice disposes the layers created so far
        }
    }

    for (auto& layer : voice->layers_)
    {
        layer.voice = backend_.play(layer.source, layer.volume, true);
        if (layer.voice == 0)
        {
            RS_WARN("VoiceEngine::startVoice: play failed for %.2f Hz", layer.frequencyHz);
            return nullptr;
        }
    }

    RS_DEBUG("VoiceEngine::startVoice: pc=%d gain=%.2f semitones=%.2f",
             pitchClassOffset, gain, semitones);
    return voice;
}

void VoiceEngine::updateFrequencies(Voice& voice, int pitchClassOffset,
                                    double transpose, double tuningCents)
{
    voice.pitchClassOffset_ = pitchClassOffset;
    voice.transpose_ = transpose;
    voice.tuningCents_ = tuningCents;
    double semitones = voice.getTotalSemitones();

    for (size_t k = 0; k < voice.layers_.size(); ++k)
    {
        auto& layer = voice.layers_[k];
        layer.frequencyHz = layerFrequency(baseFrequencyHz_, static_cast<int>(k), semitones);
        layer.volume = layerVolume(layer.frequencyHz, voice.gain_);

        if (!backend_.setFrequency(layer.source, layer.frequencyHz))
            RS_DEBUG("VoiceEngine::updateFrequencies: setFrequency rejected for %u", layer.source);
        if (!backend_.setVolume(layer.voice, layer.volume))
            RS_DEBUG("VoiceEngine::updateFrequencies: setVolume rejected for %u", layer.voice);
    }
}

void VoiceEngine::stop(std::unique_ptr<Voice> voice)
{
    if (!voice)
        return;

    for (const auto& layer : voice->layers_)
    {
        if (!backend_.fadeVolume(layer.voice, 0.0f, config_.fadeOutMs))
            RS_DEBUG("VoiceEngine::stop: fade rejected for %u", layer.voice);
    }

    int64_t due = clock_.nowMicros()
                + static_cast<int64_t>((config_.fadeOutMs + config_.releaseMarginMs) * 1000.0);
    pending_.push_back({std::move(voice), due});
}

int VoiceEngine::collectReleased()
{
    int64_t now = clock_.nowMicros();
    auto split = std::stable_partition(pending_.begin(), pending_.end(),
                                       [now](const PendingRelease& p) { return p.dueMicros > now; });
    int released = static_cast<int>(std::distance(split, pending_.end()));
    pending_.erase(split, pending_.end());
    if (released > 0)
        RS_TRACE("VoiceEngine::collectReleased: released %d voices", released);
    return released;
}

} // namespace risset
