#include "core/JuceAudioBackend.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace risset {

JuceAudioBackend::JuceAudioBackend()
{
    formatManager_.registerBasicFormats();
    voiceSources_.fill(-1);
    RS_INFO("JuceAudioBackend: created, %d audio formats",
            formatManager_.getNumKnownFormats());
}

JuceAudioBackend::~JuceAudioBackend()
{
    stop();
    RS_INFO("JuceAudioBackend: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Device (control thread)
// ═══════════════════════════════════════════════════════════════════

bool JuceAudioBackend::start(double sampleRate, int blockSize, std::string& error)
{
    RS_INFO("JuceAudioBackend::start: requested sr=%.0f bs=%d", sampleRate, blockSize);

    if (running_.load())
    {
        RS_INFO("JuceAudioBackend::start: already running, stopping first");
        stop();
    }

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    setup.sampleRate = sampleRate;
    setup.bufferSize = blockSize;

    auto err = deviceManager_.initialise(0, 2, nullptr, true, {}, &setup);
    if (err.isNotEmpty())
    {
        error = err.toStdString();
        RS_WARN("JuceAudioBackend::start: initialise failed: %s", error.c_str());
        return false;
    }

    if (deviceManager_.getCurrentAudioDevice() == nullptr)
    {
        error = "No audio output device available";
        RS_WARN("JuceAudioBackend::start: %s", error.c_str());
        return false;
    }

    // Hand the audio-side state to the callback; commands queue from here on
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        attached_.store(true, std::memory_order_release);
    }
    deviceManager_.addAudioCallback(this);
    RS_INFO("JuceAudioBackend::start: device opened");
    return true;
}

void JuceAudioBackend::stop()
{
    if (!running_.load() && !attached_.load() && deviceManager_.getCurrentAudioDevice() == nullptr)
        return;

    RS_INFO("JuceAudioBackend::stop");
    deviceManager_.removeAudioCallback(this);
    deviceManager_.closeAudioDevice();

    // The callback is gone: take the state back and apply what it left queued
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        int pending = commands_.receiveAll([this](const Command& cmd) { applyCommand(cmd); });
        attached_.store(false, std::memory_order_release);
        if (pending > 0)
            RS_DEBUG("JuceAudioBackend::stop: applied %d queued commands", pending);
    }
    running_.store(false);
    blockSize_ = 0;
}

bool JuceAudioBackend::isRunning() const
{
    return running_.load();
}

double JuceAudioBackend::getSampleRate() const
{
    return running_.load() ? sampleRate_.load() : 0.0;
}

int JuceAudioBackend::getBlockSize() const
{
    return running_.load() ? blockSize_ : 0;
}

void JuceAudioBackend::setGlobalVolume(float volume)
{
    globalVolume_.store(juce::jlimit(0.0f, 2.0f, volume), std::memory_order_relaxed);
}

// ═══════════════════════════════════════════════════════════════════
// Handles (control side)
// ═══════════════════════════════════════════════════════════════════

uint32_t JuceAudioBackend::makeHandle(uint32_t& serial, int slot, int capacity)
{
    uint32_t handle = 0;
    while (handle == 0)
    {
        ++serial;
        handle = serial * static_cast<uint32_t>(capacity) + static_cast<uint32_t>(slot) + 1;
    }
    return handle;
}

int JuceAudioBackend::liveSourceSlot(SourceHandle source) const
{
    if (source == 0)
        return -1;
    int slot = slotOf(source, kMaxSources);
    return sourceHandles_[static_cast<size_t>(slot)] == source ? slot : -1;
}

int JuceAudioBackend::liveVoiceSlot(VoiceHandle voice) const
{
    if (voice == 0)
        return -1;
    int slot = slotOf(voice, kMaxVoices);
    return voiceHandles_[static_cast<size_t>(slot)] == voice ? slot : -1;
}

// Caller holds controlMutex_
bool JuceAudioBackend::post(const Command& cmd)
{
    if (!attached_.load(std::memory_order_acquire))
    {
        applyCommand(cmd);
        return true;
    }

    if (!commands_.send(cmd))
    {
        RS_WARN("JuceAudioBackend: command queue full, dropping command %d",
                static_cast<int>(cmd.type));
        return false;
    }
    return true;
}

AudioBackend::SourceHandle JuceAudioBackend::createOscillator(Waveform waveform, double frequencyHz)
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    auto it = std::find(sourceHandles_.begin(), sourceHandles_.end(), 0u);
    if (it == sourceHandles_.end())
    {
        RS_WARN("JuceAudioBackend::createOscillator: all %d sources in use", kMaxSources);
        return 0;
    }

    int slot = static_cast<int>(std::distance(sourceHandles_.begin(), it));
    Command cmd;
    cmd.type = Command::Type::createSource;
    cmd.slot = slot;
    cmd.waveform = waveform;
    cmd.value = frequencyHz;
    if (!post(cmd))
        return 0;

    *it = makeHandle(nextSerial_, slot, kMaxSources);
    RS_TRACE("JuceAudioBackend::createOscillator: handle=%u freq=%.2f", *it, frequencyHz);
    return *it;
}

bool JuceAudioBackend::setFrequency(SourceHandle source, double frequencyHz)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int slot = liveSourceSlot(source);
    if (slot < 0)
        return false;

    Command cmd;
    cmd.type = Command::Type::setFrequency;
    cmd.slot = slot;
    cmd.value = frequencyHz;
    return post(cmd);
}

AudioBackend::VoiceHandle JuceAudioBackend::play(SourceHandle source, float volume, bool /*loop*/)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int sourceSlot = liveSourceSlot(source);
    if (sourceSlot < 0)
        return 0;

    auto it = std::find(voiceHandles_.begin(), voiceHandles_.end(), 0u);
    if (it == voiceHandles_.end())
    {
        RS_WARN("JuceAudioBackend::play: all %d voices in use", kMaxVoices);
        return 0;
    }

    int slot = static_cast<int>(std::distance(voiceHandles_.begin(), it));
    Command cmd;
    cmd.type = Command::Type::play;
    cmd.slot = slot;
    cmd.sourceSlot = sourceSlot;
    cmd.volume = volume;
    if (!post(cmd))
        return 0;

    *it = makeHandle(nextSerial_, slot, kMaxVoices);
    voiceSources_[static_cast<size_t>(slot)] = sourceSlot;
    return *it;
}

bool JuceAudioBackend::setVolume(VoiceHandle voice, float volume)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int slot = liveVoiceSlot(voice);
    if (slot < 0)
        return false;

    Command cmd;
    cmd.type = Command::Type::setVolume;
    cmd.slot = slot;
    cmd.volume = volume;
    cmd.value = kVolumeRampSeconds;
    return post(cmd);
}

bool JuceAudioBackend::fadeVolume(VoiceHandle voice, float targetVolume, double durationMs)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int slot = liveVoiceSlot(voice);
    if (slot < 0)
        return false;

    Command cmd;
    cmd.type = Command::Type::fade;
    cmd.slot = slot;
    cmd.volume = targetVolume;
    cmd.value = std::max(0.0, durationMs) / 1000.0;
    return post(cmd);
}

bool JuceAudioBackend::stop(VoiceHandle voice)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int slot = liveVoiceSlot(voice);
    if (slot < 0)
        return false;

    Command cmd;
    cmd.type = Command::Type::stopVoice;
    cmd.slot = slot;
    if (!post(cmd))
        return false;

    voiceHandles_[static_cast<size_t>(slot)] = 0;
    voiceSources_[static_cast<size_t>(slot)] = -1;
    return true;
}

bool JuceAudioBackend::dispose(SourceHandle source)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    int slot = liveSourceSlot(source);
    if (slot < 0)
        return false;

    Command cmd;
    cmd.type = Command::Type::disposeSource;
    cmd.slot = slot;
    if (!post(cmd))
        return false;

    // Voices still playing the source go with it
    for (size_t v = 0; v < voiceSources_.size(); ++v)
    {
        if (voiceSources_[v] == slot)
        {
            voiceHandles_[v] = 0;
            voiceSources_[v] = -1;
        }
    }
    sourceHandles_[static_cast<size_t>(slot)] = 0;
    return true;
}

int JuceAudioBackend::getLiveSourceCount() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return static_cast<int>(std::count_if(sourceHandles_.begin(), sourceHandles_.end(),
                                          [](uint32_t h) { return h != 0; }));
}

int JuceAudioBackend::getLiveVoiceCount() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return static_cast<int>(std::count_if(voiceHandles_.begin(), voiceHandles_.end(),
                                          [](uint32_t h) { return h != 0; }));
}

// ═══════════════════════════════════════════════════════════════════
// Samples (control side)
// ═══════════════════════════════════════════════════════════════════

AudioBackend::SampleId JuceAudioBackend::loadSample(const std::string& path, std::string& error)
{
    juce::File file(path);
    if (!file.existsAsFile())
    {
        error = "File not found: " + path;
        RS_WARN("JuceAudioBackend::loadSample: %s", error.c_str());
        return -1;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(file));
    if (!reader)
    {
        error = "Unsupported or corrupted audio file: " + path;
        RS_WARN("JuceAudioBackend::loadSample: %s", error.c_str());
        return -1;
    }

    auto numChannels = static_cast<int>(reader->numChannels);
    auto numSamples = static_cast<int>(reader->lengthInSamples);
    juce::AudioBuffer<float> data(numChannels, numSamples);
    if (!reader->read(&data, 0, numSamples, 0, true, true))
    {
        error = "Failed to read audio data from: " + path;
        RS_WARN("JuceAudioBackend::loadSample: %s", error.c_str());
        return -1;
    }

    SampleId id = addSample(std::move(data), reader->sampleRate,
                            file.getFileNameWithoutExtension().toStdString());
    if (id < 0)
        error = "Sample table full";
    return id;
}

AudioBackend::SampleId JuceAudioBackend::addSample(juce::AudioBuffer<float>&& data,
                                                   double sampleRate, const std::string& name)
{
    if (data.getNumChannels() < 1 || data.getNumSamples() < 1 || sampleRate <= 0.0)
    {
        RS_WARN("JuceAudioBackend::addSample: invalid params (ch=%d, len=%d, sr=%.1f)",
                data.getNumChannels(), data.getNumSamples(), sampleRate);
        return -1;
    }

    std::lock_guard<std::mutex> lock(controlMutex_);
    reclaimSamples();
    auto it = std::find(samples_.begin(), samples_.end(), nullptr);
    if (it == samples_.end())
    {
        RS_WARN("JuceAudioBackend::addSample: sample table full (%d)", kMaxSamples);
        return -1;
    }

    auto sample = std::make_unique<SampleData>();
    sample->data = std::move(data);
    sample->sampleRate = sampleRate;
    sample->name = name;

    auto id = static_cast<SampleId>(std::distance(samples_.begin(), it));
    publishedSamples_[static_cast<size_t>(id)].store(sample.get(), std::memory_order_release);
    samples_[static_cast<size_t>(id)] = std::move(sample);
    RS_INFO("JuceAudioBackend::addSample: id=%d name=%s len=%d sr=%.1f",
            id, name.c_str(), samples_[static_cast<size_t>(id)]->data.getNumSamples(), sampleRate);
    return id;
}

bool JuceAudioBackend::releaseSample(SampleId sample)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (sample < 0 || sample >= kMaxSamples)
        return false;

    auto& published = publishedSamples_[static_cast<size_t>(sample)];
    if (published.load(std::memory_order_acquire) == nullptr)
        return false;

    published.store(nullptr, std::memory_order_release);
    Command cmd;
    cmd.type = Command::Type::releaseSample;
    cmd.slot = sample;
    if (!post(cmd))
    {
        published.store(samples_[static_cast<size_t>(sample)].get(), std::memory_order_release);
        return false;
    }
    RS_DEBUG("JuceAudioBackend::releaseSample: id=%d", sample);
    return true;
}

int JuceAudioBackend::getSampleCount() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return static_cast<int>(std::count_if(publishedSamples_.begin(), publishedSamples_.end(),
        [](const std::atomic<const SampleData*>& p) { return p.load() != nullptr; }));
}

// Caller holds controlMutex_. Frees samples the audio side has dropped.
void JuceAudioBackend::reclaimSamples()
{
    for (size_t i = 0; i < samples_.size(); ++i)
    {
        if (sampleReleased_[i].exchange(false, std::memory_order_acq_rel))
            samples_[i].reset();
    }
}

bool JuceAudioBackend::playSample(SampleId sample, float volume)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (sample < 0 || sample >= kMaxSamples
        || publishedSamples_[static_cast<size_t>(sample)].load(std::memory_order_acquire) == nullptr)
        return false;

    Command cmd;
    cmd.type = Command::Type::playSample;
    cmd.slot = sample;
    cmd.volume = volume;
    return post(cmd);
}

// ═══════════════════════════════════════════════════════════════════
// Audio thread
// ═══════════════════════════════════════════════════════════════════

float JuceAudioBackend::oscillator(Waveform waveform, double phase)
{
    switch (waveform)
    {
        case Waveform::sine:
            return static_cast<float>(std::sin(juce::MathConstants<double>::twoPi * phase));
        case Waveform::triangle:
            return static_cast<float>(1.0 - 4.0 * std::abs(phase - 0.5));
        case Waveform::square:
            return phase < 0.5 ? 1.0f : -1.0f;
        case Waveform::saw:
            return static_cast<float>(2.0 * phase - 1.0);
    }
    return 0.0f;
}

// Phase at which each waveform crosses zero, so a voice starts without a step
double JuceAudioBackend::startPhase(Waveform waveform)
{
    switch (waveform)
    {
        case Waveform::triangle: return 0.25;
        case Waveform::saw:      return 0.5;
        case Waveform::sine:
        case Waveform::square:   return 0.0;
    }
    return 0.0;
}

void JuceAudioBackend::applyCommand(const Command& cmd)
{
    const double sr = sampleRate_.load(std::memory_order_relaxed);

    switch (cmd.type)
    {
        case Command::Type::createSource:
        {
            auto& source = sources_[static_cast<size_t>(cmd.slot)];
            source.active = true;
            source.waveform = cmd.waveform;
            source.frequency = cmd.value;
            break;
        }
        case Command::Type::setFrequency:
            sources_[static_cast<size_t>(cmd.slot)].frequency = cmd.value;
            break;

        case Command::Type::play:
        {
            auto& voice = voices_[static_cast<size_t>(cmd.slot)];
            voice.active = true;
            voice.source = cmd.sourceSlot;
            voice.phase = startPhase(sources_[static_cast<size_t>(cmd.sourceSlot)].waveform);
            voice.gain.reset(sr, kVolumeRampSeconds);
            voice.gain.setCurrentAndTargetValue(cmd.volume);
            break;
        }
        case Command::Type::setVolume:
        case Command::Type::fade:
        {
            // Ramp from wherever the gain is now
            auto& voice = voices_[static_cast<size_t>(cmd.slot)];
            float current = voice.gain.getCurrentValue();
            voice.gain.reset(sr, cmd.value);
            voice.gain.setCurrentAndTargetValue(current);
            voice.gain.setTargetValue(cmd.volume);
            break;
        }
        case Command::Type::stopVoice:
            voices_[static_cast<size_t>(cmd.slot)].active = false;
            break;

        case Command::Type::disposeSource:
            sources_[static_cast<size_t>(cmd.slot)].active = false;
            for (auto& voice : voices_)
            {
                if (voice.active && voice.source == cmd.slot)
                    voice.active = false;
            }
            break;

        case Command::Type::playSample:
        {
            const SampleData* sample =
                publishedSamples_[static_cast<size_t>(cmd.slot)].load(std::memory_order_acquire);
            if (!sample)
                break;
            // Round-robin; the oldest click is cut when all slots are busy
            auto& sv = sampleVoices_[static_cast<size_t>(nextSampleVoice_)];
            nextSampleVoice_ = (nextSampleVoice_ + 1) % kMaxSampleVoices;
            sv.slot = cmd.slot;
            sv.sample = sample;
            sv.position = 0.0;
            sv.volume = cmd.volume;
            break;
        }
        case Command::Type::releaseSample:
            for (auto& sv : sampleVoices_)
            {
                if (sv.slot == cmd.slot)
                {
                    sv.slot = -1;
                    sv.sample = nullptr;
                }
            }
            sampleReleased_[static_cast<size_t>(cmd.slot)].store(true, std::memory_order_release);
            break;
    }
}

void JuceAudioBackend::prepare(double sampleRate)
{
    if (running_.load())
    {
        RS_WARN("JuceAudioBackend::prepare: ignored while the device is running");
        return;
    }
    if (sampleRate > 0.0)
        sampleRate_.store(sampleRate);
}

void JuceAudioBackend::render(float* const* outputChannels, int numChannels, int numSamples)
{
    if (attached_.load(std::memory_order_acquire))
    {
        commands_.receiveAll([this](const Command& cmd) { applyCommand(cmd); });
        renderBlock(outputChannels, numChannels, numSamples);
        return;
    }

    std::lock_guard<std::mutex> lock(controlMutex_);
    renderBlock(outputChannels, numChannels, numSamples);
}

void JuceAudioBackend::renderBlock(float* const* outputChannels, int numChannels, int numSamples)
{
    for (int ch = 0; ch < numChannels; ++ch)
        if (outputChannels[ch] != nullptr)
            juce::FloatVectorOperations::clear(outputChannels[ch], numSamples);

    if (numChannels < 1 || outputChannels[0] == nullptr || numSamples < 1)
        return;

    float* mix = outputChannels[0];
    const double sr = sampleRate_.load(std::memory_order_relaxed);

    for (auto& voice : voices_)
    {
        if (!voice.active)
            continue;
        const auto& source = sources_[static_cast<size_t>(voice.source)];
        if (!source.active)
        {
            voice.active = false;
            continue;
        }

        const double increment = source.frequency / sr;
        for (int i = 0; i < numSamples; ++i)
        {
            mix[i] += voice.gain.getNextValue() * oscillator(source.waveform, voice.phase);
            voice.phase += increment;
            voice.phase -= std::floor(voice.phase);
        }
    }

    for (auto& sv : sampleVoices_)
    {
        if (!sv.sample)
            continue;

        const auto& data = sv.sample->data;
        const int length = data.getNumSamples();
        const float* src = data.getReadPointer(0);
        const double step = sv.sample->sampleRate / sr;

        for (int i = 0; i < numSamples; ++i)
        {
            int idx = static_cast<int>(sv.position);
            if (idx >= length - 1)
            {
                sv.slot = -1;
                sv.sample = nullptr;
                break;
            }
            float frac = static_cast<float>(sv.position - idx);
            mix[i] += sv.volume * (src[idx] + frac * (src[idx + 1] - src[idx]));
            sv.position += step;
        }
    }

    juce::FloatVectorOperations::multiply(mix, globalVolume_.load(std::memory_order_relaxed),
                                          numSamples);

    for (int ch = 1; ch < numChannels; ++ch)
        if (outputChannels[ch] != nullptr)
            juce::FloatVectorOperations::copy(outputChannels[ch], mix, numSamples);
}

void JuceAudioBackend::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/, int /*numInputChannels*/,
    float* const* outputChannelData, int numOutputChannels,
    int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    render(outputChannelData, numOutputChannels, numSamples);
}

void JuceAudioBackend::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    double sr = device->getCurrentSampleRate();
    int bs = device->getCurrentBufferSizeSamples();

    RS_INFO("JuceAudioBackend::audioDeviceAboutToStart: sr=%.0f bs=%d", sr, bs);

    sampleRate_.store(sr);
    blockSize_ = bs;
    running_.store(true);
}

void JuceAudioBackend::audioDeviceStopped()
{
    RS_INFO("JuceAudioBackend::audioDeviceStopped");
    running_.store(false);
    blockSize_ = 0;
}

} // namespace risset
