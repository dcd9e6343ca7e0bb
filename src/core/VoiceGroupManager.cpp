#include "core/VoiceGroupManager.h"
#include "core/Logger.h"

#include <algorithm>

namespace risset {

const std::vector<int>& chordIntervals(ChordQuality quality)
{
    static const std::vector<int> major{0, 4, 7};
    static const std::vector<int> minor{0, 3, 7};
    static const std::vector<int> diminished{0, 3, 6};
    static const std::vector<int> augmented{0, 4, 8};
    static const std::vector<int> melody{0};

    switch (quality) {
        case ChordQuality::major:      return major;
        case ChordQuality::minor:      return minor;
        case ChordQuality::diminished: return diminished;
        case ChordQuality::augmented:  return augmented;
        case ChordQuality::melody:     return melody;
    }
    return melody;
}

const char* chordQualityName(ChordQuality quality)
{
    switch (quality) {
        case ChordQuality::major:      return "maj";
        case ChordQuality::minor:      return "min";
        case ChordQuality::diminished: return "dim";
        case ChordQuality::augmented:  return "aug";
        case ChordQuality::melody:     return "melody";
    }
    return "unknown";
}

double chordGain(ChordQuality quality)
{
    // Single voices get more level than each voice of a triad
    return quality == ChordQuality::melody ? 0.48 : 0.28;
}

VoiceGroupManager::VoiceGroupManager(VoiceEngine& engine)
    : engine_(engine)
{
}

VoiceGroupManager::~VoiceGroupManager()
{
    releaseAll();
}

bool VoiceGroupManager::touchDown(int pointerId, int rootPitchClass, ChordQuality quality)
{
    if (groups_.count(pointerId) != 0)
    {
        RS_DEBUG("VoiceGroupManager::touchDown: pointer %d already active", pointerId);
        return false;
    }

    VoiceGroup group;
    group.pointerId = pointerId;
    group.rootPitchClass = rootPitchClass;
    group.quality = quality;

    double gain = chordGain(quality);
    for (int interval : chordIntervals(quality))
    {
        auto voice = engine_.startVoice(rootPitchClass + interval, gain, transpose_, tuningCents_);
        if (!voice)
        {
            RS_WARN("VoiceGroupManager::touchDown: voice failed for pointer %d (%s root %d)",
                    pointerId, chordQualityName(quality), rootPitchClass);
            for (auto& started : group.voices)
                engine_.stop(std::move(started));
            return false;
        }
        group.voices.push_back(std::move(voice));
    }

    RS_DEBUG("VoiceGroupManager::touchDown: pointer %d %s root %d",
             pointerId, chordQualityName(quality), rootPitchClass);
    groups_.emplace(pointerId, std::move(group));
    return true;
}

bool VoiceGroupManager::touchMove(int pointerId, int rootPitchClass, ChordQuality quality)
{
    auto it = groups_.find(pointerId);
    if (it == groups_.end() || it->second.quality != quality)
        return false;

    auto& group = it->second;
    if (group.rootPitchClass == rootPitchClass)
        return true;

    group.rootPitchClass = rootPitchClass;
    retune(group);
    RS_TRACE("VoiceGroupManager::touchMove: pointer %d root %d", pointerId, rootPitchClass);
    return true;
}

bool VoiceGroupManager::touchUp(int pointerId)
{
    auto it = groups_.find(pointerId);
    if (it == groups_.end())
        return false;

    for (auto& voice : it->second.voices)
        engine_.stop(std::move(voice));
    groups_.erase(it);
    RS_DEBUG("VoiceGroupManager::touchUp: pointer %d", pointerId);
    return true;
}

void VoiceGroupManager::releaseAll()
{
    for (auto& entry : groups_)
    {
        for (auto& voice : entry.second.voices)
            engine_.stop(std::move(voice));
    }
    groups_.clear();
}

void VoiceGroupManager::setTranspose(double semitones)
{
    transpose_ = semitones;
    retuneAll();
}

void VoiceGroupManager::setTuningCents(double cents)
{
    tuningCents_ = cents;
    retuneAll();
}

void VoiceGroupManager::setReferencePitch(double referencePitchHz)
{
    engine_.setReferencePitch(referencePitchHz);
    retuneAll();
}

const VoiceGroup* VoiceGroupManager::getGroup(int pointerId) const
{
    auto it = groups_.find(pointerId);
    return it == groups_.end() ? nullptr : &it->second;
}

std::vector<int> VoiceGroupManager::getActiveRoots(ChordQuality quality) const
{
    std::vector<int> roots;
    for (const auto& entry : groups_)
    {
        if (entry.second.quality == quality)
            roots.push_back(entry.second.rootPitchClass);
    }
    std::sort(roots.begin(), roots.end());
    roots.erase(std::unique(roots.begin(), roots.end()), roots.end());
    return roots;
}

void VoiceGroupManager::retune(VoiceGroup& group)
{
    const auto& intervals = chordIntervals(group.quality);
    for (size_t i = 0; i < group.voices.size() && i < intervals.size(); ++i)
    {
        engine_.updateFrequencies(*group.voices[i], group.rootPitchClass + intervals[i],
                                  transpose_, tuningCents_);
    }
}

void VoiceGroupManager::retuneAll()
{
    for (auto& entry : groups_)
        retune(entry.second);
}

} // namespace risset
