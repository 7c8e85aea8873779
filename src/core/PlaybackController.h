#pragma once

#include "core/AudioEngine.h"
#include "core/DubProject.h"
#include "core/ExportController.h"
#include "core/PlaybackSet.h"
#include "core/Scheduler.h"

#include <string>

namespace redub {

enum class PlaybackState { stopped, playingSingle, playingFull };

const char* playbackStateName(PlaybackState state);

/// Live preview: either one segment (heard on the monitor only) or the
/// whole dubbed timeline in sync with the video transport. Control thread.
///
/// Every transition cancels the voices of the previous one first. While an
/// export is busy the transport and voices belong to it, and every request
/// here is refused.
class PlaybackController {
public:
    /// A single-segment preview returns to stopped this long after the
    /// segment's source duration.
    static constexpr double kPreviewTailSeconds = 1.5;

    PlaybackController(AudioEngine& engine, DubProject& project, Scheduler& scheduler,
                       PlaybackSet& playbackSet, const ExportController& exporter);

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// stopped/single -> full (from 0), full -> stopped. Returns false when
    /// refused.
    bool toggleFullPreview();

    /// Play one synthesized segment from its start time. Fails, leaving the
    /// current state alone, when the segment is unknown or has no audio, or
    /// an export is busy.
    bool previewSegment(const std::string& segmentId, std::string& error);

    /// Pause the transport, cancel all voices, go to stopped.
    void stop();

    // --- Completions and timers (driven by the session) ---
    void onTransportEnded();
    void update();

    PlaybackState getState() const;
    bool isPlaying() const;

private:
    void cancelAll();
    bool exportBusy(const char* what) const;

    AudioEngine& engine_;
    DubProject& project_;
    Scheduler& scheduler_;
    PlaybackSet& playbackSet_;
    const ExportController& exporter_;

    PlaybackState state_ = PlaybackState::stopped;
    double previewDeadline_ = 0.0;
    bool transportEnded_ = false;
};

} // namespace redub
