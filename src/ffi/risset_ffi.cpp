#include "ffi/risset_ffi.h"
#include "core/AppContext.h"
#include "core/Logger.h"

#include <juce_events/juce_events.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <mutex>

// --- AppHandle ---

struct AppHandle {
    risset::AppContext app;
    std::mutex audioMutex;
};

static AppHandle* cast(RsApp a)
{
    return static_cast<AppHandle*>(a);
}

static risset::AppContext& ctx(RsApp a)
{
    return cast(a)->app;
}

// --- JUCE initialization ---

static bool juceInitialised = false;
static juce::ScopedJuceInitialiser_GUI* juceInit = nullptr;

static void ensureJuceInit()
{
    if (!juceInitialised)
    {
        juceInit = new juce::ScopedJuceInitialiser_GUI();
        juceInitialised = true;
    }
}

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

// --- Enum helpers ---

static bool toChannel(int channel, risset::FeedbackChannel& out)
{
    if (channel < 0 || channel >= risset::kFeedbackChannelCount)
    {
        RS_WARN("rs: invalid feedback channel %d", channel);
        return false;
    }
    out = static_cast<risset::FeedbackChannel>(channel);
    return true;
}

static bool toQuality(int quality, risset::ChordQuality& out)
{
    if (quality < 0 || quality > static_cast<int>(risset::ChordQuality::melody))
    {
        RS_WARN("rs: invalid chord quality %d", quality);
        return false;
    }
    out = static_cast<risset::ChordQuality>(quality);
    return true;
}

// --- Logger API ---

void rs_set_log_level(int level)
{
    risset::Logger::setLevel(static_cast<risset::LogLevel>(level));
}

void rs_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    risset::Logger::setCallback(callback, user_data);
}

// --- String free ---

void rs_free_string(char* s)
{
    free(s);
}

// ═══════════════════════════════════════════════════════════════════
// App lifecycle
// ═══════════════════════════════════════════════════════════════════

RsApp rs_app_create(char** error)
{
    ensureJuceInit();
    try
    {
        return static_cast<RsApp>(new AppHandle());
    }
    catch (const std::exception& e)
    {
        set_error(error, e.what());
        return nullptr;
    }
}

void rs_app_destroy(RsApp app)
{
    delete cast(app);
}

char* rs_version(RsApp /*app*/)
{
    return to_c_string("0.1.0");
}

int rs_poll(RsApp app)
{
    if (!app)
    {
        risset::Logger::drain();
        return 0;
    }
    return ctx(app).poll();
}

// ═══════════════════════════════════════════════════════════════════
// Audio device
// ═══════════════════════════════════════════════════════════════════

bool rs_audio_start(RsApp app, double sample_rate, int block_size, char** error)
{
    auto* h = cast(app);
    std::lock_guard<std::mutex> lock(h->audioMutex);
    std::string err;
    bool ok = h->app.getAudio().start(sample_rate, block_size, err);
    if (!ok)
        set_error(error, err);
    else if (error)
        *error = nullptr;
    return ok;
}

void rs_audio_stop(RsApp app)
{
    auto* h = cast(app);
    std::lock_guard<std::mutex> lock(h->audioMutex);
    h->app.getAudio().stop();
}

bool rs_audio_is_running(RsApp app)
{
    return ctx(app).getAudio().isRunning();
}

double rs_audio_sample_rate(RsApp app)
{
    return ctx(app).getAudio().getSampleRate();
}

// ═══════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════

void rs_set_reference_pitch(RsApp app, int hz)
{
    ctx(app).setReferencePitch(hz);
}

int rs_get_reference_pitch(RsApp app)
{
    return ctx(app).getSettings().getReferencePitch();
}

void rs_set_transpose(RsApp app, int semitones)
{
    ctx(app).setTranspose(semitones);
}

int rs_get_transpose(RsApp app)
{
    return ctx(app).getSettings().getTranspose();
}

void rs_set_tuning(RsApp app, int cents)
{
    ctx(app).setTuningCents(cents);
}

int rs_get_tuning(RsApp app)
{
    return ctx(app).getSettings().getTuningCents();
}

void rs_set_global_volume(RsApp app, double volume)
{
    ctx(app).setGlobalVolume(volume);
}

double rs_get_global_volume(RsApp app)
{
    return ctx(app).getSettings().getGlobalVolume();
}

void rs_set_channel_offset(RsApp app, int channel, int offset_ms)
{
    risset::FeedbackChannel ch;
    if (toChannel(channel, ch))
        ctx(app).setChannelOffsetMs(ch, offset_ms);
}

int rs_get_channel_offset(RsApp app, int channel)
{
    risset::FeedbackChannel ch;
    if (!toChannel(channel, ch))
        return 0;
    return ctx(app).getSettings().getChannelOffsetMs(ch);
}

// ═══════════════════════════════════════════════════════════════════
// Tracks
// ═══════════════════════════════════════════════════════════════════

int rs_track_count(RsApp app)
{
    return ctx(app).getTracks().getTrackCount();
}

bool rs_track_start(RsApp app, int track_id)
{
    return ctx(app).getTracks().start(track_id);
}

void rs_track_stop(RsApp app, int track_id)
{
    ctx(app).getTracks().stop(track_id);
}

bool rs_start_all(RsApp app)
{
    return ctx(app).getTracks().startAll();
}

void rs_stop_all(RsApp app)
{
    ctx(app).getTracks().stopAll();
}

bool rs_track_set_tempo(RsApp app, int track_id, int bpm)
{
    return ctx(app).getTracks().setTempo(track_id, bpm);
}

bool rs_track_set_beats(RsApp app, int track_id, int beats_per_measure)
{
    return ctx(app).getTracks().setBeatsPerMeasure(track_id, beats_per_measure);
}

bool rs_track_set_muted(RsApp app, int track_id, bool muted)
{
    return ctx(app).getTracks().setMuted(track_id, muted);
}

bool rs_track_set_channel_enabled(RsApp app, int track_id, int channel, bool enabled)
{
    risset::FeedbackChannel ch;
    if (!toChannel(channel, ch))
        return false;
    return ctx(app).getTracks().setChannelEnabled(track_id, ch, enabled);
}

bool rs_track_set_channel_offset(RsApp app, int track_id, int channel, int offset_ms)
{
    risset::FeedbackChannel ch;
    if (!toChannel(channel, ch))
        return false;
    return ctx(app).getTracks().setChannelOffsetMs(track_id, ch, offset_ms);
}

int rs_track_tap(RsApp app, int track_id)
{
    return ctx(app).getTracks().tap(track_id);
}

bool rs_track_load_click(RsApp app, int track_id, bool strong, const char* path, char** error)
{
    if (!path)
    {
        set_error(error, "path is NULL");
        return false;
    }
    std::string err;
    bool ok = ctx(app).loadClick(track_id, strong, path, err);
    if (!ok)
        set_error(error, err);
    else if (error)
        *error = nullptr;
    return ok;
}

RsTrackStatus rs_track_status(RsApp app, int track_id)
{
    RsTrackStatus result{};
    risset::TrackStatus status;
    if (!ctx(app).getTracks().getStatus(track_id, status))
        return result;

    result.bpm = status.bpm;
    result.beats_per_measure = status.beatsPerMeasure;
    result.running = status.running;
    result.muted = status.muted;
    result.last_beat = status.lastBeat;
    result.ticks_in_session = status.ticksInSession;
    return result;
}

void rs_set_tick_callback(RsApp app, RsTickCallback callback, void* user_data)
{
    ctx(app).getTracks().setTickCallback(callback, user_data);
}

void rs_set_feedback_callback(RsApp app, RsFeedbackCallback callback, void* user_data)
{
    ctx(app).getFeedbackSink().setCallback(callback, user_data);
}

// ═══════════════════════════════════════════════════════════════════
// Voices
// ═══════════════════════════════════════════════════════════════════

bool rs_touch_down(RsApp app, int pointer_id, int root, int quality)
{
    risset::ChordQuality q;
    if (!toQuality(quality, q))
        return false;
    return ctx(app).getVoices().touchDown(pointer_id, root, q);
}

bool rs_touch_move(RsApp app, int pointer_id, int root, int quality)
{
    risset::ChordQuality q;
    if (!toQuality(quality, q))
        return false;
    return ctx(app).getVoices().touchMove(pointer_id, root, q);
}

bool rs_touch_up(RsApp app, int pointer_id)
{
    return ctx(app).getVoices().touchUp(pointer_id);
}

void rs_release_all(RsApp app)
{
    ctx(app).getVoices().releaseAll();
}

int rs_active_group_count(RsApp app)
{
    return ctx(app).getVoices().getActiveGroupCount();
}

int rs_active_roots(RsApp app, int quality, int* roots, int max_roots)
{
    risset::ChordQuality q;
    if (!roots || max_roots <= 0 || !toQuality(quality, q))
        return 0;

    auto active = ctx(app).getVoices().getActiveRoots(q);
    int count = std::min(static_cast<int>(active.size()), max_roots);
    std::copy(active.begin(), active.begin() + count, roots);
    return count;
}

// ═══════════════════════════════════════════════════════════════════
// Tuner
// ═══════════════════════════════════════════════════════════════════

void rs_tuner_push(RsApp app, bool found, double frequency_hz, double confidence)
{
    risset::PitchEstimate estimate;
    estimate.frequencyHz = frequency_hz;
    estimate.confidence = confidence;
    ctx(app).getTuner().push(found, estimate);
}

RsTunerReading rs_tuner_reading(RsApp app)
{
    RsTunerReading result{};
    auto& tuner = ctx(app).getTuner();
    if (!tuner.hasReading())
        return result;

    const auto& note = tuner.getNote();
    result.has_reading = true;
    result.frequency_hz = tuner.getFrequency();
    result.note = to_c_string(note.name);
    result.octave = note.octave;
    result.cents = note.cents;
    result.in_tune = tuner.isInTune();
    return result;
}

void rs_free_tuner_reading(RsTunerReading reading)
{
    free(reading.note);
}

bool rs_tuner_consume_in_tune(RsApp app)
{
    return ctx(app).getTuner().consumeInTuneEdge();
}
