#pragma once

#include "core/AudioBackend.h"
#include "core/BeatScheduler.h"
#include "core/Clock.h"
#include "core/Feedback.h"
#include "core/Semaphore.h"
#include "core/SettingsStore.h"
#include "core/TapTempo.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace risset {

// Invoked from the dispatch thread for every tick and pre-tick of a running
// track, muted or not.
using TickCallback = void(*)(int trackId, int beat, bool isPre, void* userData);

struct TrackConfig {
    std::string name;
    int bpm = 120;
    int beatsPerMeasure = 4;
    bool muted = false;
    bool persistToSettings = false;  // write bpm / beats back on change
    AudioBackend::SampleId strongClick = -1;
    AudioBackend::SampleId weakClick = -1;
};

struct TrackStatus {
    int bpm = 0;
    int beatsPerMeasure = 0;
    bool running = false;
    bool muted = false;
    int lastBeat = 0;              // last tick delivered, 0 before the first
    int64_t ticksInSession = 0;    // ticks delivered since start()
    uint32_t generation = 0;
};

/// Owns the rhythmic tracks and fans their events out to feedback channels.
///
/// Each track runs its own BeatScheduler. A single dispatch thread drains all
/// schedulers, forwards events to the tick callback and fires the enabled
/// channels. Channel offsets are dispatch-time deferrals:
///   offset >= 0  fires offset ms after the tick,
///   offset <  0  fires leadTime + offset after the pre-tick (never before it).
/// Muting suppresses channels only; schedulers keep counting.
class TrackCoordinator {
public:
    static constexpr int kMaxTracks = 8;

    TrackCoordinator(Clock& clock, AudioBackend& audio, FeedbackSink& sink, SettingsStore& settings);
    ~TrackCoordinator();

    TrackCoordinator(const TrackCoordinator&) = delete;
    TrackCoordinator& operator=(const TrackCoordinator&) = delete;

    // Returns the new track id, or -1 when kMaxTracks are already present.
    int addTrack(const TrackConfig& config);
    int getTrackCount() const;

    // --- Transport ---
    bool start(int trackId);
    bool startAll();   // all or nothing
    void stop(int trackId);
    void stopAll();

    // --- Track parameters ---
    bool setTempo(int trackId, int bpm);
    bool setBeatsPerMeasure(int trackId, int beatsPerMeasure);
    bool setMuted(int trackId, bool muted);
    bool setChannelEnabled(int trackId, FeedbackChannel channel, bool enabled);
    bool setChannelOffsetMs(int trackId, FeedbackChannel channel, int offsetMs);
    bool setClicks(int trackId, AudioBackend::SampleId strong, AudioBackend::SampleId weak);

    // Records a tap; returns the bpm applied, or 0 when fewer than two taps
    // are held (or the track id is invalid).
    int tap(int trackId, int64_t tapMicros);
    int tap(int trackId);

    void setTickCallback(TickCallback callback, void* userData);

    bool getStatus(int trackId, TrackStatus& out) const;

private:
    struct Track {
        TrackConfig config;
        std::unique_ptr<BeatScheduler> scheduler;
        std::array<bool, kFeedbackChannelCount> enabled{{true, true, false, false}};
        std::array<int, kFeedbackChannelCount> offsetsMs{};
        bool muted = false;
        TapTempo tapTempo;
        int lastBeat = 0;
        int64_t ticksInSession = 0;
    };

    // A fired tick or channel waiting to be executed outside the lock
    struct Action {
        enum class Type { tickCallback, channel };
        Type type = Type::channel;
        int trackId = 0;
        int beat = 0;
        bool isPre = false;
        FeedbackChannel channel = FeedbackChannel::sound;
        FeedbackStrength strength = FeedbackStrength::weak;
        AudioBackend::SampleId sample = -1;
    };

    struct Deferred {
        int64_t dueMicros;
        int trackId;
        uint32_t generation;
        int beat;
        FeedbackChannel channel;

        bool operator>(const Deferred& other) const { return dueMicros > other.dueMicros; }
    };

    Track* findTrack(int trackId) const;
    void dispatchLoop();
    void handleEvent(int trackId, Track& track, const TickEvent& event,
                     std::vector<Action>& actions);
    void scheduleChannel(int trackId, const Track& track, const TickEvent& event,
                         FeedbackChannel channel, int64_t delayMicros,
                         std::vector<Action>& actions);
    Action channelAction(int trackId, const Track& track, int beat, FeedbackChannel channel) const;
    void execute(const Action& action);

    Clock& clock_;
    AudioBackend& audio_;
    FeedbackSink& sink_;
    SettingsStore& settings_;

    Semaphore wakeup_;

    mutable std::mutex tracksMutex_;
    std::vector<std::unique_ptr<Track>> tracks_;

    std::atomic<TickCallback> tickCallback_{nullptr};
    std::atomic<void*> tickUserData_{nullptr};

    // Dispatch thread only
    std::priority_queue<Deferred, std::vector<Deferred>, std::greater<Deferred>> deferred_;

    std::atomic<bool> running_{true};
    std::thread dispatchThread_;
};

} // namespace risset
