#pragma once

#include "core/AudioBackend.h"
#include "core/Channel.h"

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace risset {

/// AudioBackend on top of juce::AudioDeviceManager.
///
/// Control-side calls allocate handles and post commands to the audio
/// thread; the device callback applies them and renders all oscillator
/// voices and click samples into the output. Control-side methods may be
/// called from several threads.
///
/// While no device callback is attached, commands are applied on the calling
/// thread, so a backend that never started keeps no backlog. render() then
/// renders offline under the control lock.
class JuceAudioBackend : public AudioBackend, public juce::AudioIODeviceCallback {
public:
    static constexpr int kMaxSources = 256;
    static constexpr int kMaxVoices = 256;
    static constexpr int kMaxSamples = 32;
    static constexpr int kMaxSampleVoices = 32;

    JuceAudioBackend();
    ~JuceAudioBackend() override;

    JuceAudioBackend(const JuceAudioBackend&) = delete;
    JuceAudioBackend& operator=(const JuceAudioBackend&) = delete;

    // --- Device (control thread) ---
    bool start(double sampleRate, int blockSize, std::string& error);
    void stop();
    bool isRunning() const;
    double getSampleRate() const;
    int getBlockSize() const;

    void setGlobalVolume(float volume);

    // --- AudioBackend ---
    SourceHandle createOscillator(Waveform waveform, double frequencyHz) override;
    bool setFrequency(SourceHandle source, double frequencyHz) override;
    // Oscillators are endless; loop is accepted for interface parity.
    VoiceHandle play(SourceHandle source, float volume, bool loop) override;
    bool setVolume(VoiceHandle voice, float volume) override;
    bool fadeVolume(VoiceHandle voice, float targetVolume, double durationMs) override;
    bool stop(VoiceHandle voice) override;
    bool dispose(SourceHandle source) override;

    SampleId loadSample(const std::string& path, std::string& error) override;
    bool playSample(SampleId sample, float volume) override;

    // Registers already-decoded audio as a click sample
    SampleId addSample(juce::AudioBuffer<float>&& data, double sampleRate, const std::string& name);

    // Stops the sample and frees its slot once the audio side has let go of it
    bool releaseSample(SampleId sample);
    int getSampleCount() const;

    // Handle for slot under the next serial; serials that would encode to 0 are skipped
    static uint32_t makeHandle(uint32_t& serial, int slot, int capacity);

    int getLiveSourceCount() const;
    int getLiveVoiceCount() const;

    // --- Offline rendering (no device open) ---
    void prepare(double sampleRate);
    void render(float* const* outputChannels, int numChannels, int numSamples);

    // --- juce::AudioIODeviceCallback (audio thread) ---
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData, int numInputChannels,
        float* const* outputChannelData, int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    struct Command {
        enum class Type { createSource, setFrequency, play, setVolume, fade, stopVoice,
                          disposeSource, playSample, releaseSample };
        Type type = Type::createSource;
        int slot = 0;          // source, voice or sample slot
        int sourceSlot = 0;    // play only
        Waveform waveform = Waveform::sine;
        double value = 0.0;    // frequency or ramp length in seconds
        float volume = 0.0f;
    };

    struct SourceState {
        bool active = false;
        Waveform waveform = Waveform::sine;
        double frequency = 0.0;
    };

    struct VoiceState {
        bool active = false;
        int source = 0;
        double phase = 0.0;
        juce::SmoothedValue<float> gain;
    };

    struct SampleData {
        juce::AudioBuffer<float> data;
        double sampleRate = 0.0;
        std::string name;
    };

    struct SampleVoice {
        int slot = -1;
        const SampleData* sample = nullptr;
        double position = 0.0;
        float volume = 0.0f;
    };

    static constexpr int kCommandCapacity = 4096;
    static constexpr double kVolumeRampSeconds = 0.01;

    static int slotOf(uint32_t handle, int capacity) { return static_cast<int>((handle - 1) % static_cast<uint32_t>(capacity)); }
    int liveSourceSlot(SourceHandle source) const;
    int liveVoiceSlot(VoiceHandle voice) const;
    bool post(const Command& cmd);
    void reclaimSamples();

    void applyCommand(const Command& cmd);
    void renderBlock(float* const* outputChannels, int numChannels, int numSamples);
    static float oscillator(Waveform waveform, double phase);
    static double startPhase(Waveform waveform);

    // Control side (guarded by controlMutex_)
    mutable std::mutex controlMutex_;
    std::array<uint32_t, kMaxSources> sourceHandles_{};
    std::array<uint32_t, kMaxVoices> voiceHandles_{};
    std::array<int, kMaxVoices> voiceSources_{};
    uint32_t nextSerial_ = 0;

    juce::AudioFormatManager formatManager_;
    std::array<std::unique_ptr<SampleData>, kMaxSamples> samples_;
    std::array<std::atomic<const SampleData*>, kMaxSamples> publishedSamples_{};
    std::array<std::atomic<bool>, kMaxSamples> sampleReleased_{};

    // True while the device callback owns the audio-side state. Written under
    // controlMutex_.
    std::atomic<bool> attached_{false};
    Channel<Command, kCommandCapacity> commands_{NoSignal{}};

    // Audio side
    std::array<SourceState, kMaxSources> sources_;
    std::array<VoiceState, kMaxVoices> voices_;
    std::array<SampleVoice, kMaxSampleVoices> sampleVoices_;
    int nextSampleVoice_ = 0;
    std::atomic<float> globalVolume_{1.0f};

    juce::AudioDeviceManager deviceManager_;
    std::atomic<bool> running_{false};
    std::atomic<double> sampleRate_{44100.0};
    int blockSize_ = 0;
};

} // namespace risset
