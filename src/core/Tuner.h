#pragma once

#include <string>
#include <vector>

namespace risset {

struct PitchEstimate {
    double frequencyHz = 0.0;
    double confidence = 0.0;  // 0..1
};

/// Pitch-detection boundary. Implementations analyse one fixed-size buffer
/// and return false when no pitch was found (silence, noise).
class PitchDetector {
public:
    static constexpr int kBufferSize = 2048;
    static constexpr double kSampleRate = 22050.0;

    virtual ~PitchDetector() = default;
    virtual bool detect(const float* samples, int numSamples, PitchEstimate& out) = 0;
};

struct NoteReading {
    std::string name;   // "C", "C#", ... "B"
    int octave = 4;
    int cents = 0;      // clamped to [-50, 50]
};

// Nearest equal-tempered note to frequencyHz given the A4 reference.
NoteReading frequencyToNote(double frequencyHz, double referencePitchHz);

/// Turns a stream of detector results into a stable display reading.
class TunerReading {
public:
    static constexpr int kHistorySize = 2;
    static constexpr int kSilenceFrames = 3;
    static constexpr int kInTuneCents = 5;

    explicit TunerReading(double referencePitchHz = 440.0);

    void setReferencePitch(double referencePitchHz);

    // Feed one detector result; found == false for a frame without pitch.
    void push(bool found, const PitchEstimate& estimate);

    // Runs the detector over one buffer and pushes its result. An empty
    // buffer counts as a silent frame. Returns whether a pitch was found.
    bool process(PitchDetector& detector, const float* samples, int numSamples);

    bool hasReading() const { return hasReading_; }
    double getFrequency() const { return smoothedHz_; }
    const NoteReading& getNote() const { return note_; }
    bool isInTune() const;

    // True exactly once on each transition into tune
    bool consumeInTuneEdge();

private:
    double referencePitchHz_;
    std::vector<double> history_;
    int silentFrames_ = 0;
    bool hasReading_ = false;
    double smoothedHz_ = 0.0;
    NoteReading note_;
    bool wasInTune_ = false;
    bool inTuneEdge_ = false;
};

} // namespace risset
