#pragma once

#include "core/Channel.h"
#include "core/Clock.h"
#include "core/Logger.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace risset {

struct TickEvent {
    bool isPre = false;
    int beat = 0;               // 1..beatsPerMeasure, 1 = downbeat
    int64_t beatIndex = 0;      // 0-based within the session
    uint32_t generation = 0;    // session that produced the event
    int64_t deadlineMicros = 0; // internal deadline on the scheduler clock
    int64_t firedMicros = 0;    // clock reading that released the busy-wait
};

struct SchedulerCommand {
    enum class Type { start, stop, setTempo, setBeatsPerMeasure, shutdown };

    Type type = Type::stop;
    int bpm = 0;
    int beatsPerMeasure = 0;
    uint32_t generation = 0;
    int64_t issuedMicros = 0;
};

inline const char* schedulerCommandName(SchedulerCommand::Type type)
{
    switch (type) {
        case SchedulerCommand::Type::start:              return "start";
        case SchedulerCommand::Type::stop:               return "stop";
        case SchedulerCommand::Type::setTempo:           return "setTempo";
        case SchedulerCommand::Type::setBeatsPerMeasure: return "setBeatsPerMeasure";
        case SchedulerCommand::Type::shutdown:           return "shutdown";
    }
    return "unknown";
}

/// Drives one rhythmic track from a dedicated worker thread.
///
/// Deadlines are absolute: beat i of the current epoch is due at
/// anchor + i * interval, its pre-tick kLeadTimeMicros earlier. Each deadline
/// is reached with a cancellable coarse sleep followed by a busy-wait over the
/// last kPrecisionThresholdMicros.
///
/// Commands go in and events come out over Channels; the worker keeps its
/// scheduling state to itself. Methods other than pollEvents()/waitForEvents()
/// are called from the owning control thread.
class BeatScheduler {
public:
    static constexpr int kMinBpm = 1;
    static constexpr int kMaxBpm = 500;
    static constexpr int kMinBeatsPerMeasure = 1;
    static constexpr int kMaxBeatsPerMeasure = 32;
    static constexpr int64_t kLeadTimeMicros = 15000;
    static constexpr int64_t kPrecisionThresholdMicros = 1500;

    static int clampBpm(int bpm);
    static int clampBeatsPerMeasure(int beatsPerMeasure);
    static int64_t intervalMicros(int bpm);

    // eventSignal: optional semaphore posted for every event, so one consumer
    // can wait on several schedulers.
    explicit BeatScheduler(Clock& clock, Semaphore* eventSignal = nullptr);
    virtual ~BeatScheduler();

    BeatScheduler(const BeatScheduler&) = delete;
    BeatScheduler& operator=(const BeatScheduler&) = delete;

    // --- Control thread ---
    bool start(int bpm, int beatsPerMeasure);
    void stop();
    bool updateTempo(int bpm);
    bool updateBeatsPerMeasure(int beatsPerMeasure);

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    int getBpm() const { return bpm_.load(std::memory_order_relaxed); }
    int getBeatsPerMeasure() const { return beatsPerMeasure_.load(std::memory_order_relaxed); }
    uint32_t getGeneration() const { return generation_.load(std::memory_order_acquire); }

    // --- Event consumer thread ---
    // Delivers queued events of the current session in order; events from a
    // stopped or replaced session are dropped.
    template<typename Handler>
    int pollEvents(Handler&& handler)
    {
        int delivered = 0;
        TickEvent event;
        while (events_.tryReceive(event)) {
            if (!running_.load(std::memory_order_acquire)
                || event.generation != generation_.load(std::memory_order_acquire))
                continue;
            handler(event);
            ++delivered;
        }
        return delivered;
    }

    bool waitForEvents(std::chrono::microseconds timeout) { return events_.waitFor(timeout); }

protected:
    // Spawns the worker thread. Returns false if it cannot be created.
    virtual bool launchWorker();

    void workerLoop();

private:
    struct WorkerState {
        bool running = false;
        int bpm = 120;
        int beatsPerMeasure = 4;
        uint32_t generation = 0;
        int64_t anchorMicros = 0;
        int64_t beatsEmittedSinceAnchor = 0;
        int64_t beatsEmittedInSession = 0;
        int lastBeat = 0;
        int armedBeat = 1;
        bool preFired = false;
    };

    bool sendCommand(const SchedulerCommand& cmd);
    void handleCommand(const SchedulerCommand& cmd, WorkerState& state);
    void fire(WorkerState& state, bool isPre, int64_t deadline, int64_t now);
    static void armNextBeat(WorkerState& state);

    static constexpr int kCommandCapacity = 64;
    static constexpr int kEventCapacity = 256;

    Clock& clock_;
    Channel<SchedulerCommand, kCommandCapacity> commands_;
    Channel<TickEvent, kEventCapacity> events_;
    std::thread worker_;

    std::atomic<int> bpm_{120};
    std::atomic<int> beatsPerMeasure_{4};
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> generation_{0};
};

} // namespace risset
