#pragma once

#include "core/VoiceEngine.h"

#include <map>
#include <memory>
#include <vector>

namespace risset {

enum class ChordQuality { major, minor, diminished, augmented, melody };

const std::vector<int>& chordIntervals(ChordQuality quality);
const char* chordQualityName(ChordQuality quality);
double chordGain(ChordQuality quality);

struct VoiceGroup {
    int pointerId = 0;
    int rootPitchClass = 0;
    ChordQuality quality = ChordQuality::melody;
    std::vector<std::unique_ptr<Voice>> voices; // one per chord interval
};

/// Touch-driven chord voices, keyed by pointer id.
///
/// touchDown builds one Voice per interval of the chord, touchMove retunes
/// them from the new root, touchUp fades and releases them. Transpose and
/// tuning apply to every held group. Control thread only.
class VoiceGroupManager {
public:
    explicit VoiceGroupManager(VoiceEngine& engine);
    ~VoiceGroupManager();

    VoiceGroupManager(const VoiceGroupManager&) = delete;
    VoiceGroupManager& operator=(const VoiceGroupManager&) = delete;

    // False if the pointer already holds a group or a voice failed to start
    bool touchDown(int pointerId, int rootPitchClass, ChordQuality quality);
    // False if no group for the pointer or the quality differs
    bool touchMove(int pointerId, int rootPitchClass, ChordQuality quality);
    bool touchUp(int pointerId);
    void releaseAll();

    void setTranspose(double semitones);
    void setTuningCents(double cents);
    double getTranspose() const { return transpose_; }
    double getTuningCents() const { return tuningCents_; }

    // Reference pitch changes move every held layer too
    void setReferencePitch(double referencePitchHz);

    int getActiveGroupCount() const { return static_cast<int>(groups_.size()); }
    const VoiceGroup* getGroup(int pointerId) const;

    // Roots currently held for a quality (for key highlighting)
    std::vector<int> getActiveRoots(ChordQuality quality) const;

private:
    void retune(VoiceGroup& group);
    void retuneAll();

    VoiceEngine& engine_;
    std::map<int, VoiceGroup> groups_;
    double transpose_ = 0.0;
    double tuningCents_ = 0.0;
};

} // namespace risset
