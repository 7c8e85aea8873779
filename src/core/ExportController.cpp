#include "core/ExportController.h"
#include "core/Logger.h"

namespace redub {

const char* exportStateName(ExportState state)
{
    switch (state) {
        case ExportState::idle:              return "idle";
        case ExportState::ensuringSynthesis: return "ensuringSynthesis";
        case ExportState::scheduling:        return "scheduling";
        case ExportState::recording:         return "recording";
        case ExportState::finalizing:        return "finalizing";
        case ExportState::complete:          return "complete";
        case ExportState::error:             return "error";
    }
    return "unknown";
}

ExportController::ExportController(AudioEngine& engine, DubProject& project,
                                   SegmentSynthesizer& synthesizer, Scheduler& scheduler,
                                   PlaybackSet& playbackSet, StreamRecorder& recorder)
    : engine_(engine), project_(project), synthesizer_(synthesizer), scheduler_(scheduler),
      playbackSet_(playbackSet), recorder_(recorder)
{
}

void ExportController::setState(ExportState state)
{
    RD_INFO("ExportController: %s -> %s", exportStateName(state_), exportStateName(state));
    state_ = state;
}

bool ExportController::fail(const std::string& message, std::string& error)
{
    RD_WARN("ExportController: %s", message.c_str());
    errorMessage_ = message;
    error = message;
    setState(ExportState::error);
    return false;
}

bool ExportController::selectMimeType(std::string& mimeType) const
{
    for (int i = 0; i < kNumMimePreferences; ++i)
    {
        if (recorder_.isTypeSupported(kMimePreference[i]))
        {
            mimeType = kMimePreference[i];
            return true;
        }
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// start
// ═══════════════════════════════════════════════════════════════════

bool ExportController::start(const juce::File& outputDirectory, std::string& error)
{
    if (isBusy())
    {
        error = "An export is already in progress";
        RD_WARN("ExportController::start: %s", error.c_str());
        return false;
    }

    errorMessage_.clear();
    mimeType_.clear();
    outputFile_ = juce::File();
    assembledEnd_ = 0.0;
    tailWaitSeconds_ = 0.0;

    // Nothing is muted, scheduled or written unless there is something to
    // export and the runtime can capture it.
    if (engine_.getMediaDuration() <= 0.0)
        return fail("No video to export", error);
    if (project_.getNumSegments() == 0)
        return fail("No dub segments to export", error);

    if (!recorder_.canCaptureCombinedStream())
        return fail("Video export is not supported here: cannot capture video and mixed audio "
                    "as one stream", error);

    std::string mimeType;
    if (!selectMimeType(mimeType))
        return fail("Video export is not supported here: no WebM recording format available",
                    error);

    setState(ExportState::ensuringSynthesis);
    const int missing = synthesizer_.synthesizeMissing();
    if (missing > 0)
        RD_WARN("ExportController: %d segments have no audio and will be silent", missing);

    setState(ExportState::scheduling);
    playbackSet_.stopAll();
    engine_.transportStop();
    engine_.setMonitorGain(0.0f);
    assembledEnd_ = scheduler_.scheduleAll(project_.getSegments(), project_.getStore(), 0.0);

    RecordingRequest request;
    request.outputFile = outputDirectory.getChildFile(
        project_.makeExportFileName(juce::Time::currentTimeMillis()));
    request.mimeType = mimeType;
    request.sampleRate = engine_.getSampleRate();
    request.numAudioChannels = 1;

    std::string recorderError;
    if (!recorder_.start(request, recorderError))
    {
        restoreSession();
        return fail("Could not start recording: " + recorderError, error);
    }

    mimeType_ = mimeType;
    outputFile_ = request.outputFile;
    engine_.setCaptureSink(&recorder_);
    engine_.transportPlay();

    RD_INFO("ExportController: recording %s (%s), video=%.3f s, assembled end=%.3f s",
            outputFile_.getFullPathName().toRawUTF8(), mimeType_.c_str(),
            engine_.getMediaDuration(), assembledEnd_);
    setState(ExportState::recording);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Completions and timers
// ═══════════════════════════════════════════════════════════════════

void ExportController::onTransportEnded()
{
    if (state_ != ExportState::recording)
        return;

    setState(ExportState::finalizing);

    const double tail = assembledEnd_ - engine_.getMediaDuration();
    if (tail <= 0.0)
    {
        tailWaitSeconds_ = 0.0;
        finish();
        return;
    }

    tailWaitSeconds_ = tail + kSafetyMarginSeconds;
    stopDeadline_ = engine_.getCurrentTime() + tailWaitSeconds_;
    RD_INFO("ExportController: video ended, dub tail runs %.3f s longer, stopping in %.3f s",
            tail, tailWaitSeconds_);
}

void ExportController::update()
{
    if (state_ == ExportState::finalizing && engine_.getCurrentTime() >= stopDeadline_)
        finish();
}

void ExportController::finish()
{
    engine_.setCaptureSink(nullptr);
    recorder_.stop();
    restoreSession();

    RD_INFO("ExportController: wrote %s", outputFile_.getFullPathName().toRawUTF8());
    setState(ExportState::complete);
}

void ExportController::restoreSession()
{
    engine_.transportStop();
    playbackSet_.stopAll();
    engine_.stopAllVoices();
    engine_.setMonitorGain(1.0f);
}

void ExportController::reset()
{
    if (state_ == ExportState::recording || state_ == ExportState::finalizing)
    {
        RD_WARN("ExportController::reset: abandoning export of %s",
                outputFile_.getFullPathName().toRawUTF8());
        engine_.setCaptureSink(nullptr);
        recorder_.stop();
        restoreSession();
    }

    errorMessage_.clear();
    tailWaitSeconds_ = 0.0;
    if (state_ != ExportState::idle)
        setState(ExportState::idle);
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

ExportState ExportController::getState() const { return state_; }

bool ExportController::isBusy() const
{
    return state_ != ExportState::idle && state_ != ExportState::complete
        && state_ != ExportState::error;
}

const std::string& ExportController::getErrorMessage() const { return errorMessage_; }
double ExportController::getAssembledEnd() const { return assembledEnd_; }
double ExportController::getTailWaitSeconds() const { return tailWaitSeconds_; }
const juce::File& ExportController::getOutputFile() const { return outputFile_; }
const std::string& ExportController::getMimeType() const { return mimeType_; }

} // namespace redub
