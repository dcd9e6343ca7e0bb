#include "core/TrackCoordinator.h"
#include "core/Logger.h"

#include <algorithm>
#include <exception>

namespace risset {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

TrackCoordinator::TrackCoordinator(Clock& clock, AudioBackend& audio,
                                   FeedbackSink& sink, SettingsStore& settings)
    : clock_(clock)
    , audio_(audio)
    , sink_(sink)
    , settings_(settings)
{
    dispatchThread_ = std::thread([this] { dispatchLoop(); });
    RS_INFO("TrackCoordinator: created, dispatch thread started");
}

TrackCoordinator::~TrackCoordinator()
{
    running_.store(false, std::memory_order_release);
    wakeup_.post();
    if (dispatchThread_.joinable())
        dispatchThread_.join();

    std::lock_guard<std::mutex> lock(tracksMutex_);
    for (auto& track : tracks_)
        track->scheduler->stop();
    tracks_.clear();
    RS_INFO("TrackCoordinator: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Track management (control thread)
// ═══════════════════════════════════════════════════════════════════

int TrackCoordinator::addTrack(const TrackConfig& config)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    if (static_cast<int>(tracks_.size()) >= kMaxTracks)
    {
        RS_WARN("TrackCoordinator::addTrack: limit of %d tracks reached", kMaxTracks);
        return -1;
    }

    auto track = std::make_unique<Track>();
    track->config = config;
    track->config.bpm = BeatScheduler::clampBpm(config.bpm);
    track->config.beatsPerMeasure = BeatScheduler::clampBeatsPerMeasure(config.beatsPerMeasure);
    track->muted = config.muted;
    track->scheduler = std::make_unique<BeatScheduler>(clock_, &wakeup_);
    track->scheduler->updateTempo(track->config.bpm);
    track->scheduler->updateBeatsPerMeasure(track->config.beatsPerMeasure);

    for (int c = 0; c < kFeedbackChannelCount; ++c)
        track->offsetsMs[static_cast<size_t>(c)] =
            settings_.getChannelOffsetMs(static_cast<FeedbackChannel>(c));

    int id = static_cast<int>(tracks_.size());
    tracks_.push_back(std::move(track));
    RS_INFO("TrackCoordinator::addTrack: id=%d name=%s bpm=%d beats=%d",
            id, config.name.c_str(), tracks_.back()->config.bpm,
            tracks_.back()->config.beatsPerMeasure);
    return id;
}

int TrackCoordinator::getTrackCount() const
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    return static_cast<int>(tracks_.size());
}

TrackCoordinator::Track* TrackCoordinator::findTrack(int trackId) const
{
    if (trackId < 0 || trackId >= static_cast<int>(tracks_.size()))
    {
        RS_DEBUG("TrackCoordinator: unknown track %d", trackId);
        return nullptr;
    }
    return tracks_[static_cast<size_t>(trackId)].get();
}

bool TrackCoordinator::start(int trackId)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    if (track->scheduler->isRunning())
        track->scheduler->stop();

    track->lastBeat = 0;
    track->ticksInSession = 0;
    if (!track->scheduler->start(track->scheduler->getBpm(),
                                 track->scheduler->getBeatsPerMeasure()))
    {
        RS_WARN("TrackCoordinator::start: track %d failed to start", trackId);
        return false;
    }
    return true;
}

bool TrackCoordinator::startAll()
{
    int count = getTrackCount();
    for (int id = 0; id < count; ++id)
    {
        if (!start(id))
        {
            for (int started = 0; started < id; ++started)
                stop(started);
            return false;
        }
    }
    return true;
}

void TrackCoordinator::stop(int trackId)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return;

    track->scheduler->stop();
    track->lastBeat = 0;
    track->ticksInSession = 0;
}

void TrackCoordinator::stopAll()
{
    int count = getTrackCount();
    for (int id = 0; id < count; ++id)
        stop(id);
}

bool TrackCoordinator::setTempo(int trackId, int bpm)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    int clamped = BeatScheduler::clampBpm(bpm);
    if (!track->scheduler->updateTempo(clamped))
        return false;

    track->config.bpm = clamped;
    if (track->config.persistToSettings)
        settings_.setBpm(clamped);
    return true;
}

bool TrackCoordinator::setBeatsPerMeasure(int trackId, int beatsPerMeasure)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    int clamped = BeatScheduler::clampBeatsPerMeasure(beatsPerMeasure);
    if (!track->scheduler->updateBeatsPerMeasure(clamped))
        return false;

    track->config.beatsPerMeasure = clamped;
    if (track->config.persistToSettings)
        settings_.setBeatsPerMeasure(clamped);
    return true;
}

bool TrackCoordinator::setMuted(int trackId, bool muted)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    track->muted = muted;
    RS_DEBUG("TrackCoordinator::setMuted: track %d %s", trackId, muted ? "muted" : "unmuted");
    return true;
}

bool TrackCoordinator::setChannelEnabled(int trackId, FeedbackChannel channel, bool enabled)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    track->enabled[static_cast<size_t>(channel)] = enabled;
    return true;
}

bool TrackCoordinator::setChannelOffsetMs(int trackId, FeedbackChannel channel, int offsetMs)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    track->offsetsMs[static_cast<size_t>(channel)] =
        std::clamp(offsetMs, SettingsStore::kMinOffsetMs, SettingsStore::kMaxOffsetMs);
    return true;
}

bool TrackCoordinator::setClicks(int trackId, AudioBackend::SampleId strong,
                                 AudioBackend::SampleId weak)
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    track->config.strongClick = strong;
    track->config.weakClick = weak;
    return true;
}

int TrackCoordinator::tap(int trackId, int64_t tapMicros)
{
    int bpm = 0;
    {
        std::lock_guard<std::mutex> lock(tracksMutex_);
        Track* track = findTrack(trackId);
        if (!track)
            return 0;
        bpm = track->tapTempo.tap(tapMicros);
    }

    if (bpm == 0)
        return 0;
    return setTempo(trackId, bpm) ? bpm : 0;
}

int TrackCoordinator::tap(int trackId)
{
    return tap(trackId, clock_.nowMicros());
}

void TrackCoordinator::setTickCallback(TickCallback callback, void* userData)
{
    tickUserData_.store(userData, std::memory_order_release);
    tickCallback_.store(callback, std::memory_order_release);
}

bool TrackCoordinator::getStatus(int trackId, TrackStatus& out) const
{
    std::lock_guard<std::mutex> lock(tracksMutex_);
    Track* track = findTrack(trackId);
    if (!track)
        return false;

    out.bpm = track->scheduler->getBpm();
    out.beatsPerMeasure = track->scheduler->getBeatsPerMeasure();
    out.running = track->scheduler->isRunning();
    out.muted = track->muted;
    out.lastBeat = track->lastBeat;
    out.ticksInSession = track->ticksInSession;
    out.generation = track->scheduler->getGeneration();
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Dispatch thread
// ═══════════════════════════════════════════════════════════════════

void TrackCoordinator::dispatchLoop()
{
    RS_TRACE("TrackCoordinator: dispatch thread running");

    std::vector<Action> actions;
    actions.reserve(64);

    while (running_.load(std::memory_order_acquire))
    {
        if (deferred_.empty())
        {
            wakeup_.wait();
        }
        else
        {
            int64_t wait = deferred_.top().dueMicros - clock_.nowMicros();
            if (wait > 0)
                wakeup_.waitFor(std::chrono::microseconds(wait));
        }

        if (!running_.load(std::memory_order_acquire))
            break;

        actions.clear();
        {
            std::lock_guard<std::mutex> lock(tracksMutex_);

            for (size_t id = 0; id < tracks_.size(); ++id)
            {
                Track& track = *tracks_[id];
                track.scheduler->pollEvents([&](const TickEvent& event) {
                    handleEvent(static_cast<int>(id), track, event, actions);
                });
            }

            int64_t now = clock_.nowMicros();
            while (!deferred_.empty() && deferred_.top().dueMicros <= now)
            {
                Deferred item = deferred_.top();
                deferred_.pop();

                Track* track = findTrack(item.trackId);
                if (!track || track->muted
                    || !track->scheduler->isRunning()
                    || track->scheduler->getGeneration() != item.generation
                    || !track->enabled[static_cast<size_t>(item.channel)])
                    continue;
                actions.push_back(channelAction(item.trackId, *track, item.beat, item.channel));
            }
        }

        for (const auto& action : actions)
            execute(action);
    }

    RS_TRACE("TrackCoordinator: dispatch thread exiting");
}

void TrackCoordinator::handleEvent(int trackId, Track& track, const TickEvent& event,
                                   std::vector<Action>& actions)
{
    Action notify;
    notify.type = Action::Type::tickCallback;
    notify.trackId = trackId;
    notify.beat = event.beat;
    notify.isPre = event.isPre;
    actions.push_back(notify);

    if (!event.isPre)
    {
        track.lastBeat = event.beat;
        ++track.ticksInSession;
    }

    if (track.muted)
        return;

    for (int c = 0; c < kFeedbackChannelCount; ++c)
    {
        auto channel = static_cast<FeedbackChannel>(c);
        if (!track.enabled[static_cast<size_t>(c)])
            continue;

        int offsetMs = track.offsetsMs[static_cast<size_t>(c)];
        if (event.isPre && offsetMs < 0)
        {
            int64_t delay = std::max<int64_t>(0, BeatScheduler::kLeadTimeMicros + offsetMs * 1000LL);
            scheduleChannel(trackId, track, event, channel, delay, actions);
        }
        else if (!event.isPre && offsetMs >= 0)
        {
            scheduleChannel(trackId, track, event, channel, offsetMs * 1000LL, actions);
        }
    }
}

void TrackCoordinator::scheduleChannel(int trackId, const Track& track, const TickEvent& event,
                                       FeedbackChannel channel, int64_t delayMicros,
                                       std::vector<Action>& actions)
{
    if (delayMicros <= 0)
    {
        actions.push_back(channelAction(trackId, track, event.beat, channel));
        return;
    }
    deferred_.push({event.firedMicros + delayMicros, trackId, event.generation,
                    event.beat, channel});
}

TrackCoordinator::Action TrackCoordinator::channelAction(int trackId, const Track& track,
                                                         int beat, FeedbackChannel channel) const
{
    Action action;
    action.type = Action::Type::channel;
    action.trackId = trackId;
    action.beat = beat;
    action.channel = channel;
    action.strength = beat == 1 ? FeedbackStrength::strong : FeedbackStrength::weak;
    action.sample = action.strength == FeedbackStrength::strong
                  ? track.config.strongClick : track.config.weakClick;
    return action;
}

void TrackCoordinator::execute(const Action& action)
{
    if (action.type == Action::Type::tickCallback)
    {
        auto callback = tickCallback_.load(std::memory_order_acquire);
        if (!callback)
            return;
        try
        {
            callback(action.trackId, action.beat, action.isPre,
                     tickUserData_.load(std::memory_order_acquire));
        }
        catch (const std::exception& e)
        {
            RS_WARN("TrackCoordinator: tick callback threw for track %d beat %d: %s",
                    action.trackId, action.beat, e.what());
        }
        return;
    }

    FeedbackPulse pulse = pulseFor(action.channel, action.strength);
    if (action.channel == FeedbackChannel::sound)
    {
        if (action.sample < 0)
        {
            RS_TRACE("TrackCoordinator: track %d has no click sample", action.trackId);
            return;
        }
        if (!audio_.playSample(action.sample, pulse.amplitude))
            RS_DEBUG("TrackCoordinator: click %d rejected", action.sample);
        return;
    }

    try
    {
        sink_.fire(action.trackId, pulse);
    }
    catch (const std::exception& e)
    {
        RS_WARN("TrackCoordinator: %s sink threw for track %d: %s",
                feedbackChannelName(action.channel), action.trackId, e.what());
    }
}

} // namespace risset
