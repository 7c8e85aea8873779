#pragma once

#include "core/AudioEngine.h"
#include "core/DubProject.h"
#include "core/ExportController.h"
#include "core/PlaybackController.h"
#include "core/PlaybackSet.h"
#include "core/Scheduler.h"
#include "core/SegmentStore.h"
#include "core/SegmentSynthesizer.h"

#include <string>
#include <vector>

namespace redub {

/// Everything one open video needs, owned in one place and wired together.
///
/// The host calls update() periodically from the control thread (a UI timer,
/// or a loop in tests): it delivers the engine's completions to the
/// controllers and fires their deadline checks.
class DubSession {
public:
    DubSession(const EngineConfig& config, SynthesisService& synthesis, StreamRecorder& recorder);
    ~DubSession();

    DubSession(const DubSession&) = delete;
    DubSession& operator=(const DubSession&) = delete;

    AudioEngine& getEngine() { return engine_; }
    SegmentStore& getStore() { return store_; }
    DubProject& getProject() { return project_; }
    SegmentSynthesizer& getSynthesizer() { return synthesizer_; }
    PlaybackSet& getPlaybackSet() { return playbackSet_; }
    Scheduler& getScheduler() { return scheduler_; }
    PlaybackController& getPlayback() { return playback_; }
    ExportController& getExport() { return export_; }

    /// Analyze the video and attach its audio track for suppression. A track
    /// that cannot be attached is not fatal: the session continues with the
    /// program muted.
    bool open(AnalysisService& analysis, const juce::File& video, const std::string& mimeType,
              double videoDurationSeconds, std::string& error);

    /// Stops any preview before starting the export.
    bool startExport(const juce::File& outputDirectory, std::string& error);

    /// Deliver completions and run timers. Returns the number of engine
    /// events handled.
    int update();

    /// Close the video: stop everything, drop segments and audio, detach.
    void reset();

private:
    AudioEngine engine_;
    SegmentStore store_;
    DubProject project_;
    SegmentSynthesizer synthesizer_;
    PlaybackSet playbackSet_;
    Scheduler scheduler_;
    ExportController export_;
    PlaybackController playback_;

    std::vector<EngineEvent> events_;
};

} // namespace redub
