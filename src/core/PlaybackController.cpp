#include "core/PlaybackController.h"
#include "core/Logger.h"

namespace redub {

const char* playbackStateName(PlaybackState state)
{
    switch (state) {
        case PlaybackState::stopped:       return "stopped";
        case PlaybackState::playingSingle: return "playingSingle";
        case PlaybackState::playingFull:   return "playingFull";
    }
    return "unknown";
}

PlaybackController::PlaybackController(AudioEngine& engine, DubProject& project,
                                       Scheduler& scheduler, PlaybackSet& playbackSet,
                                       const ExportController& exporter)
    : engine_(engine), project_(project), scheduler_(scheduler), playbackSet_(playbackSet),
      exporter_(exporter)
{
}

bool PlaybackController::exportBusy(const char* what) const
{
    if (!exporter_.isBusy())
        return false;
    RD_WARN("PlaybackController::%s: refused, export is %s",
            what, exportStateName(exporter_.getState()));
    return true;
}

void PlaybackController::cancelAll()
{
    playbackSet_.stopAll();
    transportEnded_ = false;
}

// ═══════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════

bool PlaybackController::toggleFullPreview()
{
    if (exportBusy("toggleFullPreview"))
        return false;

    if (state_ == PlaybackState::playingFull)
    {
        stop();
        return true;
    }

    cancelAll();
    engine_.setMonitorGain(1.0f);
    engine_.transportSeek(0.0);
    scheduler_.scheduleAll(project_.getSegments(), project_.getStore(), 0.0);
    engine_.transportPlay();

    RD_INFO("PlaybackController: %s -> playingFull", playbackStateName(state_));
    state_ = PlaybackState::playingFull;
    return true;
}

bool PlaybackController::previewSegment(const std::string& segmentId, std::string& error)
{
    if (exporter_.isBusy())
    {
        error = "Preview is unavailable while exporting";
        RD_WARN("PlaybackController::previewSegment: %s", error.c_str());
        return false;
    }

    const DubSegment* seg = project_.findSegment(segmentId);
    if (!seg)
    {
        error = "Unknown segment: " + segmentId;
        RD_WARN("PlaybackController::previewSegment: %s", error.c_str());
        return false;
    }
    ClipPtr clip = project_.getStore().get(segmentId);
    if (!clip)
    {
        error = "Segment " + segmentId + " has no synthesized audio";
        RD_WARN("PlaybackController::previewSegment: %s", error.c_str());
        return false;
    }

    cancelAll();
    engine_.transportSeek(seg->startTime);
    engine_.transportPlay();

    scheduler_.resetCursor();
    if (!scheduler_.scheduleSegment(*seg, clip, seg->startTime, VoiceRoute::monitorOnly))
        RD_WARN("PlaybackController::previewSegment: %s not started", segmentId.c_str());

    previewDeadline_ = engine_.getCurrentTime() + seg->getDuration() + kPreviewTailSeconds;

    RD_INFO("PlaybackController: %s -> playingSingle (%s, auto-stop at %.3f)",
            playbackStateName(state_), segmentId.c_str(), previewDeadline_);
    state_ = PlaybackState::playingSingle;
    return true;
}

void PlaybackController::stop()
{
    if (exportBusy("stop"))
        return;

    cancelAll();
    engine_.transportPause();

    if (state_ != PlaybackState::stopped)
        RD_INFO("PlaybackController: %s -> stopped", playbackStateName(state_));
    state_ = PlaybackState::stopped;
}

// ═══════════════════════════════════════════════════════════════════
// Completions and timers
// ═══════════════════════════════════════════════════════════════════

void PlaybackController::onTransportEnded()
{
    // A single preview ends on its own timer only.
    if (state_ == PlaybackState::playingFull)
        transportEnded_ = true;
}

void PlaybackController::update()
{
    switch (state_) {
        case PlaybackState::playingSingle:
            if (engine_.getCurrentTime() >= previewDeadline_)
                stop();
            break;
        case PlaybackState::playingFull:
            if (transportEnded_ && playbackSet_.empty())
            {
                RD_INFO("PlaybackController: timeline finished -> stopped");
                transportEnded_ = false;
                state_ = PlaybackState::stopped;
            }
            break;
        case PlaybackState::stopped:
            break;
    }
}

PlaybackState PlaybackController::getState() const { return state_; }
bool PlaybackController::isPlaying() const { return state_ != PlaybackState::stopped; }

} // namespace redub
