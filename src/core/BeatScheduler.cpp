#include "core/BeatScheduler.h"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace risset {

int BeatScheduler::clampBpm(int bpm)
{
    return std::clamp(bpm, kMinBpm, kMaxBpm);
}

int BeatScheduler::clampBeatsPerMeasure(int beatsPerMeasure)
{
    return std::clamp(beatsPerMeasure, kMinBeatsPerMeasure, kMaxBeatsPerMeasure);
}

int64_t BeatScheduler::intervalMicros(int bpm)
{
    return static_cast<int64_t>(std::llround(60000000.0 / clampBpm(bpm)));
}

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

BeatScheduler::BeatScheduler(Clock& clock, Semaphore* eventSignal)
    : clock_(clock)
    , events_(eventSignal)
{
}

BeatScheduler::~BeatScheduler()
{
    if (!worker_.joinable())
        return;

    running_.store(false, std::memory_order_release);
    SchedulerCommand cmd;
    cmd.type = SchedulerCommand::Type::shutdown;
    while (!commands_.send(cmd))
        std::this_thread::yield();
    worker_.join();
    RS_DEBUG("BeatScheduler: worker joined");
}

bool BeatScheduler::launchWorker()
{
    try
    {
        worker_ = std::thread([this] { workerLoop(); });
    }
    catch (const std::system_error& e)
    {
        RS_WARN("BeatScheduler: cannot create worker thread: %s", e.what());
        return false;
    }
    RS_DEBUG("BeatScheduler: worker thread started");
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Control thread
// ═══════════════════════════════════════════════════════════════════

bool BeatScheduler::sendCommand(const SchedulerCommand& cmd)
{
    if (!commands_.send(cmd))
    {
        RS_WARN("BeatScheduler: command channel full, dropping %s",
                schedulerCommandName(cmd.type));
        return false;
    }
    RS_TRACE("BeatScheduler: sent %s", schedulerCommandName(cmd.type));
    return true;
}

bool BeatScheduler::start(int bpm, int beatsPerMeasure)
{
    int clampedBpm = clampBpm(bpm);
    int clampedBeats = clampBeatsPerMeasure(beatsPerMeasure);
    if (clampedBpm != bpm || clampedBeats != beatsPerMeasure)
        RS_WARN("BeatScheduler::start: clamped bpm %d->%d beats %d->%d",
                bpm, clampedBpm, beatsPerMeasure, clampedBeats);

    if (!worker_.joinable() && !launchWorker())
    {
        running_.store(false, std::memory_order_release);
        return false;
    }

    SchedulerCommand cmd;
    cmd.type = SchedulerCommand::Type::start;
    cmd.bpm = clampedBpm;
    cmd.beatsPerMeasure = clampedBeats;
    cmd.generation = generation_.load(std::memory_order_relaxed) + 1;
    cmd.issuedMicros = clock_.nowMicros();

    // Publish the session before the worker can produce for it, so the
    // consumer accepts beat 0 however early it arrives
    const int previousBpm = bpm_.load(std::memory_order_relaxed);
    const int previousBeats = beatsPerMeasure_.load(std::memory_order_relaxed);
    bpm_.store(clampedBpm, std::memory_order_relaxed);
    beatsPerMeasure_.store(clampedBeats, std::memory_order_relaxed);
    generation_.store(cmd.generation, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    if (!sendCommand(cmd))
    {
        running_.store(false, std::memory_order_release);
        generation_.fetch_add(1, std::memory_order_acq_rel);
        bpm_.store(previousBpm, std::memory_order_relaxed);
        beatsPerMeasure_.store(previousBeats, std::memory_order_relaxed);
        return false;
    }

    RS_INFO("BeatScheduler::start: bpm=%d beats=%d generation=%u",
            clampedBpm, clampedBeats, cmd.generation);
    return true;
}

void BeatScheduler::stop()
{
    // Closing the generation first hides any tick racing this call
    running_.store(false, std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);

    if (!worker_.joinable())
        return;

    SchedulerCommand cmd;
    cmd.type = SchedulerCommand::Type::stop;
    cmd.issuedMicros = clock_.nowMicros();
    while (!commands_.send(cmd))
        std::this_thread::yield();
    RS_INFO("BeatScheduler::stop");
}

bool BeatScheduler::updateTempo(int bpm)
{
    int clamped = clampBpm(bpm);
    if (clamped != bpm)
        RS_WARN("BeatScheduler::updateTempo: clamped %d->%d", bpm, clamped);

    if (isRunning())
    {
        SchedulerCommand cmd;
        cmd.type = SchedulerCommand::Type::setTempo;
        cmd.bpm = clamped;
        cmd.issuedMicros = clock_.nowMicros();
        if (!sendCommand(cmd))
            return false;
    }

    bpm_.store(clamped, std::memory_order_relaxed);
    RS_DEBUG("BeatScheduler::updateTempo: bpm=%d", clamped);
    return true;
}

bool BeatScheduler::updateBeatsPerMeasure(int beatsPerMeasure)
{
    int clamped = clampBeatsPerMeasure(beatsPerMeasure);
    if (clamped != beatsPerMeasure)
        RS_WARN("BeatScheduler::updateBeatsPerMeasure: clamped %d->%d",
                beatsPerMeasure, clamped);

    if (isRunning())
    {
        SchedulerCommand cmd;
        cmd.type = SchedulerCommand::Type::setBeatsPerMeasure;
        cmd.beatsPerMeasure = clamped;
        cmd.issuedMicros = clock_.nowMicros();
        if (!sendCommand(cmd))
            return false;
    }

    beatsPerMeasure_.store(clamped, std::memory_order_relaxed);
    RS_DEBUG("BeatScheduler::updateBeatsPerMeasure: beats=%d", clamped);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Worker thread
// ═══════════════════════════════════════════════════════════════════

void BeatScheduler::armNextBeat(WorkerState& state)
{
    state.armedBeat = state.lastBeat >= state.beatsPerMeasure ? 1 : state.lastBeat + 1;
    state.preFired = false;
}

void BeatScheduler::handleCommand(const SchedulerCommand& cmd, WorkerState& state)
{
    switch (cmd.type)
    {
        case SchedulerCommand::Type::start:
            state.running = true;
            state.bpm = cmd.bpm;
            state.beatsPerMeasure = cmd.beatsPerMeasure;
            state.generation = cmd.generation;
            // Beat 0 lands one lead time out so it gets its pre-tick too
            state.anchorMicros = clock_.nowMicros() + kLeadTimeMicros;
            state.beatsEmittedSinceAnchor = 0;
            state.beatsEmittedInSession = 0;
            state.lastBeat = 0;
            armNextBeat(state);
            RS_DEBUG_RT("BeatScheduler: session %u started at %lld us",
                        state.generation, static_cast<long long>(state.anchorMicros));
            break;

        case SchedulerCommand::Type::stop:
            state.running = false;
            state.beatsEmittedSinceAnchor = 0;
            state.beatsEmittedInSession = 0;
            state.lastBeat = 0;
            RS_DEBUG_RT("BeatScheduler: session %u stopped", state.generation);
            break;

        case SchedulerCommand::Type::setTempo:
        {
            if (!state.running)
            {
                state.bpm = cmd.bpm;
                break;
            }
            // New epoch starting at the armed beat, which keeps its number.
            // Once its pre-tick is out the beat is committed and keeps its
            // deadline, at most one lead time away; otherwise it is due one
            // new interval after the change was issued.
            const int64_t armedTarget = state.anchorMicros
                                      + state.beatsEmittedSinceAnchor * intervalMicros(state.bpm);
            state.bpm = cmd.bpm;
            const int64_t interval = intervalMicros(state.bpm);
            state.anchorMicros = state.preFired ? armedTarget : cmd.issuedMicros + interval;
            state.beatsEmittedSinceAnchor = 0;
            RS_DEBUG_RT("BeatScheduler: re-anchored bpm=%d interval=%lld committed=%d",
                        state.bpm, static_cast<long long>(interval), state.preFired ? 1 : 0);
            break;
        }

        case SchedulerCommand::Type::setBeatsPerMeasure:
            // Takes effect when the next beat is armed
            state.beatsPerMeasure = cmd.beatsPerMeasure;
            break;

        case SchedulerCommand::Type::shutdown:
            break;
    }
}

void BeatScheduler::fire(WorkerState& state, bool isPre, int64_t deadline, int64_t now)
{
    TickEvent event;
    event.isPre = isPre;
    event.beat = state.armedBeat;
    event.beatIndex = state.beatsEmittedInSession;
    event.generation = state.generation;
    event.deadlineMicros = deadline;
    event.firedMicros = now;

    if (!events_.send(event))
        RS_WARN_RT("BeatScheduler: event channel full, dropped beat %lld",
                   static_cast<long long>(event.beatIndex));

    if (isPre)
    {
        state.preFired = true;
        return;
    }

    state.lastBeat = state.armedBeat;
    ++state.beatsEmittedInSession;
    ++state.beatsEmittedSinceAnchor;
    armNextBeat(state);
}

void BeatScheduler::workerLoop()
{
    RS_TRACE_RT("BeatScheduler: worker running");

    WorkerState state;

    while (true)
    {
        bool shutdown = false;
        commands_.receiveAll([&](const SchedulerCommand& cmd) {
            if (cmd.type == SchedulerCommand::Type::shutdown)
                shutdown = true;
            else
                handleCommand(cmd, state);
        });
        if (shutdown)
            break;

        if (!state.running)
        {
            commands_.wait();
            continue;
        }

        const int64_t interval = intervalMicros(state.bpm);
        const int64_t target = state.anchorMicros + state.beatsEmittedSinceAnchor * interval;
        const bool isPre = !state.preFired;
        const int64_t deadline = isPre ? target - kLeadTimeMicros : target;

        // Coarse phase. A post() ends the sleep: either a command to handle
        // or a leftover wake-up, and both mean re-evaluating from the top.
        int64_t remaining = deadline - clock_.nowMicros();
        if (remaining > kPrecisionThresholdMicros)
        {
            auto sleep = std::chrono::microseconds(remaining - kPrecisionThresholdMicros);
            if (commands_.waitFor(sleep))
                continue;
        }

        // Precision phase
        int64_t now = clock_.nowMicros();
        bool interrupted = false;
        while (now < deadline)
        {
            if (commands_.hasPending())
            {
                interrupted = true;
                break;
            }
            now = clock_.nowMicros();
        }
        if (interrupted)
            continue;

        fire(state, isPre, deadline, now);
    }

    RS_TRACE_RT("BeatScheduler: worker exiting");
}

} // namespace risset
