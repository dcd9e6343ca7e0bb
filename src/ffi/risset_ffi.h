#ifndef RISSET_FFI_H
#define RISSET_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Opaque handle ─────────────────────────────────────────────── */

typedef void* RsApp;

/* ── String ownership ──────────────────────────────────────────── */

/// Free a string returned by any rs_* function.
/// Passing NULL is safe (no-op).
void rs_free_string(char* s);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=warn, 2=info, 3=debug, 4=trace.
/// Does not require an RsApp handle.
void rs_set_log_level(int level);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
/// Messages logged from timing threads are delivered on the next rs_poll().
void rs_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── App lifecycle ─────────────────────────────────────────────── */

/// Create the application context (settings, audio backend, voice engine,
/// two metronome tracks). Returns NULL on failure (sets *error).
/// Caller owns the returned handle; free with rs_app_destroy().
/// Initializes JUCE on first call (static, process-wide).
RsApp rs_app_create(char** error);

/// Stop everything and free all resources.
/// Passing NULL is safe (no-op).
void rs_app_destroy(RsApp app);

/// Returns the library version string. Caller must rs_free_string() the result.
char* rs_version(RsApp app);

/// Control-thread housekeeping: drains timing-thread logs and releases faded
/// voices. Call periodically (e.g. from a UI timer).
/// Returns the number of voices released.
int rs_poll(RsApp app);

/* ── Audio device ──────────────────────────────────────────────── */

/// Open the default output device. Returns false on failure (sets *error).
bool rs_audio_start(RsApp app, double sample_rate, int block_size, char** error);
void rs_audio_stop(RsApp app);
bool rs_audio_is_running(RsApp app);
/// 0.0 when not running.
double rs_audio_sample_rate(RsApp app);

/* ── Settings ──────────────────────────────────────────────────── */

/// Values are clamped: reference 410..480 Hz, transpose -12..12 semitones,
/// tuning -100..100 cents, global volume 0..2, channel offsets -20..50 ms.
/// Changes apply immediately to held voices and all tracks.
void rs_set_reference_pitch(RsApp app, int hz);
int  rs_get_reference_pitch(RsApp app);
void rs_set_transpose(RsApp app, int semitones);
int  rs_get_transpose(RsApp app);
void rs_set_tuning(RsApp app, int cents);
int  rs_get_tuning(RsApp app);
void rs_set_global_volume(RsApp app, double volume);
double rs_get_global_volume(RsApp app);

/// channel: 0 = sound, 1 = haptic, 2 = vibration, 3 = flash
void rs_set_channel_offset(RsApp app, int channel, int offset_ms);
int  rs_get_channel_offset(RsApp app, int channel);

/* ── Tracks ────────────────────────────────────────────────────── */

typedef struct {
    int     bpm;
    int     beats_per_measure;
    bool    running;
    bool    muted;
    int     last_beat;          /* 0 before the first tick */
    int64_t ticks_in_session;
} RsTrackStatus;

/// Track ids are 0..rs_track_count()-1. Track 0 writes its tempo back to
/// settings; track 1 starts muted at 120 BPM, 3 beats per measure.
int rs_track_count(RsApp app);

/// Start a track from beat 1. Restarts if already running.
/// Returns false if track_id is invalid or the scheduler could not start.
bool rs_track_start(RsApp app, int track_id);
void rs_track_stop(RsApp app, int track_id);
/// Start every track, or none.
bool rs_start_all(RsApp app);
void rs_stop_all(RsApp app);

/// Values are clamped (bpm 1..500, beats 1..32).
bool rs_track_set_tempo(RsApp app, int track_id, int bpm);
bool rs_track_set_beats(RsApp app, int track_id, int beats_per_measure);
bool rs_track_set_muted(RsApp app, int track_id, bool muted);
bool rs_track_set_channel_enabled(RsApp app, int track_id, int channel, bool enabled);
bool rs_track_set_channel_offset(RsApp app, int track_id, int channel, int offset_ms);

/// Record a tap now. Returns the bpm applied, or 0 if fewer than two taps
/// are held or track_id is invalid.
int rs_track_tap(RsApp app, int track_id);

/// Replace a track's strong (downbeat) or weak click with an audio file.
bool rs_track_load_click(RsApp app, int track_id, bool strong, const char* path, char** error);

/// Returns a zeroed struct if track_id is invalid.
RsTrackStatus rs_track_status(RsApp app, int track_id);

/// Tick callback, invoked from the dispatch thread for every tick and
/// pre-tick (is_pre) of a running track, muted or not. Pass NULL to clear.
typedef void (*RsTickCallback)(int track_id, int beat, bool is_pre, void* user_data);
void rs_set_tick_callback(RsApp app, RsTickCallback callback, void* user_data);

/// Haptic / vibration / flash actuator callback (dispatch thread).
/// strength: 0 = weak, 1 = strong. Clicks go to the audio device instead.
typedef void (*RsFeedbackCallback)(int track_id, int channel, int strength,
                                   float amplitude, int duration_ms, void* user_data);
void rs_set_feedback_callback(RsApp app, RsFeedbackCallback callback, void* user_data);

/* ── Voices ────────────────────────────────────────────────────── */

/// quality: 0 = major, 1 = minor, 2 = diminished, 3 = augmented, 4 = melody
/// root: pitch class 0..11 (0 = C)

/// Start a chord for a pointer. Returns false if the pointer already holds
/// one, the quality is invalid, or the audio backend ran out of voices.
bool rs_touch_down(RsApp app, int pointer_id, int root, int quality);
/// Retune the pointer's chord to a new root (same quality). Glides in place.
bool rs_touch_move(RsApp app, int pointer_id, int root, int quality);
/// Fade the pointer's chord out.
bool rs_touch_up(RsApp app, int pointer_id);
void rs_release_all(RsApp app);
int  rs_active_group_count(RsApp app);

/// Writes up to max_roots held roots for a quality into roots.
/// Returns the number written.
int rs_active_roots(RsApp app, int quality, int* roots, int max_roots);

/* ── Tuner ─────────────────────────────────────────────────────── */

typedef struct {
    bool   has_reading;
    double frequency_hz;
    char*  note;        /* "A", "C#", ... NULL without a reading */
    int    octave;
    int    cents;       /* -50..50 */
    bool   in_tune;
} RsTunerReading;

/// Feed one pitch-detector result. found = false for a silent frame.
void rs_tuner_push(RsApp app, bool found, double frequency_hz, double confidence);

/// Current reading. Free with rs_free_tuner_reading().
RsTunerReading rs_tuner_reading(RsApp app);
void rs_free_tuner_reading(RsTunerReading reading);

/// True once per transition into tune.
bool rs_tuner_consume_in_tune(RsApp app);

#ifdef __cplusplus
}
#endif

#endif /* RISSET_FFI_H */
