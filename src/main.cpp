#include "core/AppContext.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_events/juce_events.h>

#include <chrono>
#include <cstdlib>
#include <thread>

static void onTick(int trackId, int beat, bool isPre, void*)
{
    if (!isPre)
        RS_INFO("track %d beat %d", trackId, beat);
}

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI init;
    risset::Logger::setLevel(risset::LogLevel::info);

    juce::Logger::writeToLog("risset - JUCE " + juce::String(JUCE_MAJOR_VERSION)
                             + "." + juce::String(JUCE_MINOR_VERSION)
                             + "." + juce::String(JUCE_BUILDNUMBER));

    int seconds = argc > 1 ? std::atoi(argv[1]) : 4;

    risset::AppContext app;

    std::string error;
    if (!app.getAudio().start(44100.0, 256, error))
        juce::Logger::writeToLog("No audio output (" + juce::String(error) + "), running silent");

    app.getTracks().setTickCallback(onTick, nullptr);
    if (!app.getTracks().start(risset::AppContext::kMainTrack))
    {
        juce::Logger::writeToLog("Could not start the metronome");
        return 1;
    }

    // A major triad under the beat for the first half
    app.getVoices().touchDown(0, 9, risset::ChordQuality::major);

    auto end = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    auto half = std::chrono::steady_clock::now() + std::chrono::seconds(seconds) / 2;
    while (std::chrono::steady_clock::now() < end)
    {
        if (app.getVoices().getActiveGroupCount() > 0 && std::chrono::steady_clock::now() >= half)
            app.getVoices().touchUp(0);
        app.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    app.getTracks().stopAll();
    app.poll();
    return 0;
}
