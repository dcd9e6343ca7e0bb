#pragma once

#include "core/AudioBackend.h"
#include "core/Clock.h"
#include "core/Feedback.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace risset {

// ═══════════════════════════════════════════════════════════════════
// Clocks
// ═══════════════════════════════════════════════════════════════════

// Advances by a fixed step on every read, so a busy-wait always
// terminates and lands within one step of its deadline.
class SteppingClock : public Clock {
public:
    explicit SteppingClock(int64_t stepMicros, int64_t startMicros = 1000000)
        : now_(startMicros), step_(stepMicros) {}

    int64_t nowMicros() const override { return now_.fetch_add(step_) + step_; }
    int64_t peek() const { return now_.load(); }

private:
    mutable std::atomic<int64_t> now_;
    const int64_t step_;
};

// Only moves when told to
class ManualClock : public Clock {
public:
    int64_t nowMicros() const override { return now_.load(); }
    void set(int64_t micros) { now_.store(micros); }
    void advanceMs(double ms) { now_.fetch_add(static_cast<int64_t>(ms * 1000.0)); }

private:
    std::atomic<int64_t> now_{0};
};

// ═══════════════════════════════════════════════════════════════════
// Audio backend
// ═══════════════════════════════════════════════════════════════════

// Records every command; can be told to fail after N successful calls.
class FakeAudioBackend : public AudioBackend {
public:
    struct SourceInfo {
        Waveform waveform = Waveform::sine;
        double frequencyHz = 0.0;
        int frequencyUpdates = 0;
    };

    struct VoiceInfo {
        SourceHandle source = 0;
        float volume = 0.0f;
        bool loop = false;
        bool fading = false;
        float fadeTarget = 0.0f;
        double fadeMs = 0.0;
    };

    struct SamplePlay {
        SampleId sample;
        float volume;
        std::chrono::steady_clock::time_point at;
    };

    // -1 means never fail
    int createsBeforeFailure = -1;
    int playsBeforeFailure = -1;

    SourceHandle createOscillator(Waveform waveform, double frequencyHz) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (createsBeforeFailure == 0)
            return 0;
        if (createsBeforeFailure > 0)
            --createsBeforeFailure;
        SourceHandle h = nextHandle_++;
        sources_[h] = {waveform, frequencyHz, 0};
        ++totalCreated_;
        return h;
    }

    bool setFrequency(SourceHandle source, double frequencyHz) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(source);
        if (it == sources_.end())
            return false;
        it->second.frequencyHz = frequencyHz;
        ++it->second.frequencyUpdates;
        return true;
    }

    VoiceHandle play(SourceHandle source, float volume, bool loop) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sources_.count(source) == 0)
            return 0;
        if (playsBeforeFailure == 0)
            return 0;
        if (playsBeforeFailure > 0)
            --playsBeforeFailure;
        VoiceHandle h = nextHandle_++;
        VoiceInfo info;
        info.source = source;
        info.volume = volume;
        info.loop = loop;
        voices_[h] = info;
        ++totalPlayed_;
        return h;
    }

    bool setVolume(VoiceHandle voice, float volume) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = voices_.find(voice);
        if (it == voices_.end())
            return false;
        it->second.volume = volume;
        return true;
    }

    bool fadeVolume(VoiceHandle voice, float targetVolume, double durationMs) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = voices_.find(voice);
        if (it == voices_.end())
            return false;
        it->second.fading = true;
        it->second.fadeTarget = targetVolume;
        it->second.fadeMs = durationMs;
        return true;
    }

    bool stop(VoiceHandle voice) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return voices_.erase(voice) != 0;
    }

    bool dispose(SourceHandle source) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sources_.erase(source) == 0)
            return false;
        for (auto it = voices_.begin(); it != voices_.end();)
            it = it->second.source == source ? voices_.erase(it) : std::next(it);
        return true;
    }

    SampleId loadSample(const std::string& path, std::string& error) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path.empty())
        {
            error = "empty path";
            return -1;
        }
        return nextSample_++;
    }

    bool playSample(SampleId sample, float volume) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sample < 0 || sample >= nextSample_)
                return false;
            samplePlays_.push_back({sample, volume, std::chrono::steady_clock::now()});
        }
        cv_.notify_all();
        return true;
    }

    // --- Inspection ---

    int liveSourceCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(sources_.size());
    }

    int liveVoiceCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(voices_.size());
    }

    int totalCreated() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalCreated_;
    }

    bool getSource(SourceHandle h, SourceInfo& out) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(h);
        if (it == sources_.end())
            return false;
        out = it->second;
        return true;
    }

    bool getVoice(VoiceHandle h, VoiceInfo& out) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = voices_.find(h);
        if (it == voices_.end())
            return false;
        out = it->second;
        return true;
    }

    std::vector<SamplePlay> getSamplePlays() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return samplePlays_;
    }

    bool waitForSamplePlays(size_t count, int timeoutMs)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [&] { return samplePlays_.size() >= count; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint32_t nextHandle_ = 1;
    SampleId nextSample_ = 0;
    int totalCreated_ = 0;
    int totalPlayed_ = 0;
    std::map<SourceHandle, SourceInfo> sources_;
    std::map<VoiceHandle, VoiceInfo> voices_;
    std::vector<SamplePlay> samplePlays_;
};

// ═══════════════════════════════════════════════════════════════════
// Feedback sink
// ═══════════════════════════════════════════════════════════════════

struct RecordingFeedbackSink : public FeedbackSink {
    struct Fired {
        int trackId;
        FeedbackPulse pulse;
        std::chrono::steady_clock::time_point at;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Fired> fired;
    bool throwOnFire = false;

    void fire(int trackId, const FeedbackPulse& pulse) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            fired.push_back({trackId, pulse, std::chrono::steady_clock::now()});
        }
        cv.notify_all();
        if (throwOnFire)
            throw std::runtime_error("actuator unavailable");
    }

    bool waitFor(size_t count, int timeoutMs = 2000)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                           [&] { return fired.size() >= count; });
    }

    std::vector<Fired> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return fired;
    }

    size_t count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return fired.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex);
        fired.clear();
    }
};

} // namespace risset
