#include "core/Tuner.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace risset {

static const char* const kNoteNames[12] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

NoteReading frequencyToNote(double frequencyHz, double referencePitchHz)
{
    NoteReading reading;
    if (frequencyHz <= 0.0 || referencePitchHz <= 0.0)
        return reading;

    double semitones = 12.0 * std::log2(frequencyHz / referencePitchHz);
    long rounded = std::lround(semitones);
    int cents = static_cast<int>(std::lround((semitones - static_cast<double>(rounded)) * 100.0));
    long midi = 69 + rounded;

    reading.name = kNoteNames[((midi % 12) + 12) % 12];
    reading.octave = static_cast<int>(std::floor(static_cast<double>(midi) / 12.0)) - 1;
    reading.cents = std::clamp(cents, -50, 50);
    return reading;
}

TunerReading::TunerReading(double referencePitchHz)
    : referencePitchHz_(referencePitchHz)
{
    history_.reserve(kHistorySize + 1);
}

void TunerReading::setReferencePitch(double referencePitchHz)
{
    referencePitchHz_ = referencePitchHz;
    if (hasReading_)
        note_ = frequencyToNote(smoothedHz_, referencePitchHz_);
}

void TunerReading::push(bool found, const PitchEstimate& estimate)
{
    if (!found || estimate.frequencyHz <= 0.0)
    {
        if (++silentFrames_ >= kSilenceFrames && hasReading_)
        {
            RS_TRACE("TunerReading: silence, clearing reading");
            history_.clear();
            hasReading_ = false;
            smoothedHz_ = 0.0;
            note_ = NoteReading{};
            wasInTune_ = false;
        }
        return;
    }

    silentFrames_ = 0;
    history_.push_back(estimate.frequencyHz);
    if (static_cast<int>(history_.size()) > kHistorySize)
        history_.erase(history_.begin());

    std::vector<double> sorted(history_);
    std::sort(sorted.begin(), sorted.end());
    smoothedHz_ = sorted[sorted.size() / 2];
    note_ = frequencyToNote(smoothedHz_, referencePitchHz_);
    hasReading_ = true;

    bool nowInTune = isInTune();
    if (nowInTune && !wasInTune_)
        inTuneEdge_ = true;
    wasInTune_ = nowInTune;
}

bool TunerReading::process(PitchDetector& detector, const float* samples, int numSamples)
{
    PitchEstimate estimate;
    bool found = false;
    if (samples == nullptr || numSamples <= 0)
        RS_WARN("TunerReading::process: empty buffer (%d samples)", numSamples);
    else
        found = detector.detect(samples, numSamples, estimate);

    push(found, estimate);
    return found && estimate.frequencyHz > 0.0;
}

bool TunerReading::isInTune() const
{
    return hasReading_ && std::abs(note_.cents) <= kInTuneCents;
}

bool TunerReading::consumeInTuneEdge()
{
    bool edge = inTuneEdge_;
    inTuneEdge_ = false;
    return edge;
}

} // namespace risset
