#pragma once

#include "core/AudioEngine.h"
#include "core/DubSegment.h"
#include "core/PlaybackSet.h"
#include "core/SegmentStore.h"

#include <string>
#include <vector>

namespace redub {

/// One placed clip of a scheduling pass. Times are seconds; safePlayTime is
/// on the assembled timeline, startAt on the engine clock.
struct ScheduledClip {
    std::string segmentId;
    double safePlayTime = 0.0;
    double duration = 0.0;
    double startAt = 0.0;
    int voiceId = -1;
};

/// Places synthesized clips on the timeline so that no two overlap and
/// consecutive lines are at least kGapSeconds apart:
///
///   safe(first) = startTime
///   safe(next)  = max(startTime, lastSegmentEnd + kGapSeconds)
///   startAt     = now + max(0, safe - anchor)
///
/// where lastSegmentEnd = safe + duration of the clip placed before it.
/// "now" is the engine clock, read once per pass so every clip of the pass
/// shares the same reference.
class Scheduler {
public:
    static constexpr double kGapSeconds = 0.1;

    Scheduler(AudioEngine& engine, PlaybackSet& playbackSet);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // --- Cursor ---
    void resetCursor();
    double getLastSegmentEnd() const;
    double computeSafePlayTime(double startTime) const;

    // --- Scheduling ---
    /// Place one clip after whatever the cursor already holds. Scheduled
    /// clips go to the mix bus under the segment id; a monitorOnly clip is
    /// the preview and uses PlaybackSet::kPreviewHandle.
    bool scheduleSegment(const DubSegment& segment, const ClipPtr& clip, double anchorTime,
                         VoiceRoute route = VoiceRoute::mixBus, ScheduledClip* placed = nullptr);

    /// Full pass: reset the cursor, then place every segment that has a clip
    /// in `store`, in ascending startTime order. Segments without a clip are
    /// skipped and leave the cursor alone. Returns the assembled-timeline end.
    double scheduleAll(const std::vector<DubSegment>& segments, const SegmentStore& store,
                       double anchorTime);

    /// Placements of the most recent scheduleAll().
    const std::vector<ScheduledClip>& getLastPass() const;

private:
    bool place(const DubSegment& segment, const ClipPtr& clip, double anchorTime, double now,
               VoiceRoute route, ScheduledClip& placed);

    AudioEngine& engine_;
    PlaybackSet& playbackSet_;

    double lastSegmentEnd_ = 0.0;
    bool hasPrevious_ = false;
    std::vector<ScheduledClip> lastPass_;
};

} // namespace redub
