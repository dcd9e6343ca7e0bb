#pragma once

#include <cstdint>
#include <string>

namespace risset {

enum class Waveform { sine, triangle, square, saw };

/// Parameter-command surface of the audio-rendering subsystem.
///
/// Handles are non-zero on success. Calls on stale handles return false and
/// have no effect; none of these methods throw.
class AudioBackend {
public:
    using SourceHandle = uint32_t;
    using VoiceHandle = uint32_t;
    using SampleId = int;

    virtual ~AudioBackend() = default;

    // --- Oscillators ---
    virtual SourceHandle createOscillator(Waveform waveform, double frequencyHz) = 0;
    virtual bool setFrequency(SourceHandle source, double frequencyHz) = 0;
    virtual VoiceHandle play(SourceHandle source, float volume, bool loop) = 0;
    virtual bool setVolume(VoiceHandle voice, float volume) = 0;
    virtual bool fadeVolume(VoiceHandle voice, float targetVolume, double durationMs) = 0;
    virtual bool stop(VoiceHandle voice) = 0;
    virtual bool dispose(SourceHandle source) = 0;

    // --- Percussive samples ---
    // Returns -1 and fills error if the file cannot be decoded.
    virtual SampleId loadSample(const std::string& path, std::string& error) = 0;
    virtual bool playSample(SampleId sample, float volume) = 0;
};

} // namespace risset
