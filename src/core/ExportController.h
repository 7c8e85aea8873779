#pragma once

#include "core/AudioEngine.h"
#include "core/DubProject.h"
#include "core/PlaybackSet.h"
#include "core/Scheduler.h"
#include "core/SegmentSynthesizer.h"
#include "core/StreamRecorder.h"

#include <juce_core/juce_core.h>

#include <string>

namespace redub {

enum class ExportState {
    idle,
    ensuringSynthesis,
    scheduling,
    recording,
    finalizing,
    complete,
    error
};

const char* exportStateName(ExportState state);

/// Records the video with the dubbed mix:
///
///   idle -> ensuringSynthesis -> scheduling -> recording -> finalizing -> complete
///     \______________________________________________________________-> error
///
/// The recording is kept running past the end of the video until the
/// assembled dub has played out (plus kSafetyMarginSeconds), so a dub that
/// runs longer than the picture is never cut off.
class ExportController {
public:
    static constexpr double kSafetyMarginSeconds = 0.2;
    static constexpr const char* kMimePreference[] = {"video/webm;codecs=vp9", "video/webm"};
    static constexpr int kNumMimePreferences = 2;

    ExportController(AudioEngine& engine, DubProject& project, SegmentSynthesizer& synthesizer,
                     Scheduler& scheduler, PlaybackSet& playbackSet, StreamRecorder& recorder);

    ExportController(const ExportController&) = delete;
    ExportController& operator=(const ExportController&) = delete;

    /// Runs synthesis and scheduling, then starts recording into a new file
    /// in `outputDirectory`. Returns false (state error, no file) when no
    /// video with a duration is open, the project has no segments, the
    /// runtime cannot capture, or the recorder refuses to start.
    bool start(const juce::File& outputDirectory, std::string& error);

    // --- Completions and timers (driven by the session) ---
    void onTransportEnded();
    void update();

    /// Leave any state for idle. A recording in progress is stopped and the
    /// monitor and transport are restored.
    void reset();

    ExportState getState() const;
    bool isBusy() const;
    const std::string& getErrorMessage() const;
    double getAssembledEnd() const;
    double getTailWaitSeconds() const;
    const juce::File& getOutputFile() const;
    const std::string& getMimeType() const;

private:
    bool selectMimeType(std::string& mimeType) const;
    bool fail(const std::string& message, std::string& error);
    void finish();
    void restoreSession();
    void setState(ExportState state);

    AudioEngine& engine_;
    DubProject& project_;
    SegmentSynthesizer& synthesizer_;
    Scheduler& scheduler_;
    PlaybackSet& playbackSet_;
    StreamRecorder& recorder_;

    ExportState state_ = ExportState::idle;
    std::string errorMessage_;
    std::string mimeType_;
    juce::File outputFile_;
    double assembledEnd_ = 0.0;
    double tailWaitSeconds_ = 0.0;
    double stopDeadline_ = 0.0;
};

} // namespace redub
