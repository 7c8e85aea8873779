#include "core/DubSession.h"
#include "core/Logger.h"

namespace redub {

DubSession::DubSession(const EngineConfig& config, SynthesisService& synthesis,
                       StreamRecorder& recorder)
    : engine_(config),
      store_(config.sampleRate),
      project_(store_),
      synthesizer_(project_, synthesis),
      playbackSet_(engine_),
      scheduler_(engine_, playbackSet_),
      export_(engine_, project_, synthesizer_, scheduler_, playbackSet_, recorder),
      playback_(engine_, project_, scheduler_, playbackSet_, export_)
{
    events_.reserve(64);
}

DubSession::~DubSession()
{
    export_.reset();
    playback_.stop();
}

bool DubSession::open(AnalysisService& analysis, const juce::File& video,
                      const std::string& mimeType, double videoDurationSeconds, std::string& error)
{
    reset();

    juce::MemoryBlock bytes;
    if (!video.loadFileAsData(bytes))
    {
        error = "Cannot read " + video.getFullPathName().toStdString();
        RD_WARN("DubSession::open: %s", error.c_str());
        return false;
    }

    if (!project_.analyze(analysis, bytes, mimeType, error))
        return false;

    std::string attachError;
    if (!engine_.attachProgramAudio(video, videoDurationSeconds, attachError))
        RD_WARN("DubSession::open: continuing without suppression: %s", attachError.c_str());
    return true;
}

bool DubSession::startExport(const juce::File& outputDirectory, std::string& error)
{
    playback_.stop();
    return export_.start(outputDirectory, error);
}

int DubSession::update()
{
    events_.clear();
    const int count = engine_.pollEvents(events_);

    for (const auto& ev : events_)
    {
        switch (ev.type) {
            case EngineEvent::Type::voiceEnded:
                playbackSet_.handleVoiceEnded(ev.voiceId);
                break;
            case EngineEvent::Type::transportEnded:
                RD_DEBUG("DubSession: transport ended at clock sample %lld", (long long)ev.clockSamples);
                playback_.onTransportEnded();
                export_.onTransportEnded();
                break;
        }
    }

    playback_.update();
    export_.update();
    return count;
}

void DubSession::reset()
{
    export_.reset();
    playback_.stop();
    engine_.stopAllVoices();
    project_.reset();
    engine_.detachProgramAudio();
}

} // namespace redub
