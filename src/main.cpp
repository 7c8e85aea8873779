#include "core/AudioDevice.h"
#include "core/AudioEngine.h"
#include "core/Logger.h"

#include <juce_core/juce_core.h>
#include <juce_audio_devices/juce_audio_devices.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

// Plays a video's audio track through the dialogue suppression network.
//
//   redub <program-audio-file> [backgroundVolume]
//
// REDUB_LOG=warn|info|debug|trace sets the log level.
int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::fprintf(stderr, "usage: redub <program-audio-file> [backgroundVolume]\n");
        return 2;
    }

    juce::ScopedJuceInitialiser_GUI init;

    redub::LogLevel level;
    if (const char* env = std::getenv("REDUB_LOG"))
    {
        if (redub::Logger::parseLevel(env, level))
            redub::Logger::setLevel(level);
        else
            std::fprintf(stderr, "redub: unknown log level '%s'\n", env);
    }

    redub::EngineConfig config;
    if (argc > 2)
        config.backgroundVolume = juce::jlimit(0.0f, 1.0f, (float)std::atof(argv[2]));

    redub::AudioEngine engine(config);

    juce::File input = juce::File::getCurrentWorkingDirectory().getChildFile(argv[1]);
    std::string error;
    if (!engine.attachProgramAudio(input, 0.0, error))
    {
        std::fprintf(stderr, "redub: %s\n", error.c_str());
        return 1;
    }

    redub::AudioDevice device(engine);
    if (!device.start(error))
    {
        std::fprintf(stderr, "redub: %s\n", error.c_str());
        return 1;
    }

    std::printf("Playing %s (%.1f s) on %s, background volume %.2f\n",
                input.getFileName().toRawUTF8(), engine.getMediaDuration(),
                device.getDeviceName().c_str(), (double)engine.getBackgroundVolume());

    engine.transportPlay();

    std::vector<redub::EngineEvent> events;
    bool ended = false;
    while (!ended && device.isRunning())
    {
        juce::Thread::sleep(50);
        events.clear();
        engine.pollEvents(events);
        for (const auto& ev : events)
        {
            if (ev.type == redub::EngineEvent::Type::transportEnded)
                ended = true;
        }
    }

    device.stop();
    redub::Logger::drain();
    return 0;
}
