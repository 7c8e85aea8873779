#include "core/Scheduler.h"
#include "core/Logger.h"

#include <algorithm>

namespace redub {

Scheduler::Scheduler(AudioEngine& engine, PlaybackSet& playbackSet)
    : engine_(engine), playbackSet_(playbackSet)
{
}

// ═══════════════════════════════════════════════════════════════════
// Cursor
// ═══════════════════════════════════════════════════════════════════

void Scheduler::resetCursor()
{
    lastSegmentEnd_ = 0.0;
    hasPrevious_ = false;
}

double Scheduler::getLastSegmentEnd() const
{
    return lastSegmentEnd_;
}

double Scheduler::computeSafePlayTime(double startTime) const
{
    if (!hasPrevious_)
        return std::max(startTime, lastSegmentEnd_);
    return std::max(startTime, lastSegmentEnd_ + kGapSeconds);
}

// ═══════════════════════════════════════════════════════════════════
// Scheduling
// ═══════════════════════════════════════════════════════════════════

bool Scheduler::place(const DubSegment& segment, const ClipPtr& clip, double anchorTime,
                      double now, VoiceRoute route, ScheduledClip& placed)
{
    placed.segmentId = segment.id;
    placed.duration = clip->getDurationSeconds();
    placed.safePlayTime = computeSafePlayTime(segment.startTime);
    placed.startAt = now + std::max(0.0, placed.safePlayTime - anchorTime);

    // The cursor moves even if the voice cannot be started, so a dropped
    // voice never lets the next clip slide into its slot.
    lastSegmentEnd_ = placed.safePlayTime + placed.duration;
    hasPrevious_ = true;

    placed.voiceId = engine_.startVoice(clip, placed.startAt, route);
    if (placed.voiceId < 0)
    {
        RD_WARN("Scheduler: could not start voice for %s", segment.id.c_str());
        return false;
    }

    const std::string handle = route == VoiceRoute::monitorOnly
        ? std::string(PlaybackSet::kPreviewHandle) : segment.id;
    playbackSet_.add(handle, placed.voiceId);

    RD_DEBUG("Scheduler: %s start=%.3f safe=%.3f dur=%.3f at=%.4f voice=%d",
             segment.id.c_str(), segment.startTime, placed.safePlayTime, placed.duration,
             placed.startAt, placed.voiceId);
    return true;
}

bool Scheduler::scheduleSegment(const DubSegment& segment, const ClipPtr& clip,
                                double anchorTime, VoiceRoute route, ScheduledClip* placed)
{
    if (!clip)
    {
        RD_DEBUG("Scheduler::scheduleSegment: %s has no audio, skipped", segment.id.c_str());
        return false;
    }

    ScheduledClip result;
    bool ok = place(segment, clip, anchorTime, engine_.getCurrentTime(), route, result);
    if (placed)
        *placed = result;
    return ok;
}

double Scheduler::scheduleAll(const std::vector<DubSegment>& segments, const SegmentStore& store,
                              double anchorTime)
{
    std::vector<const DubSegment*> ordered;
    ordered.reserve(segments.size());
    for (const auto& seg : segments)
        ordered.push_back(&seg);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const DubSegment* a, const DubSegment* b) { return a->startTime < b->startTime; });

    resetCursor();
    lastPass_.clear();

    const double now = engine_.getCurrentTime();
    int skipped = 0;
    int failed = 0;
    for (const DubSegment* seg : ordered)
    {
        ClipPtr clip = store.get(seg->id);
        if (!clip)
        {
            RD_DEBUG("Scheduler::scheduleAll: %s has no audio, skipped", seg->id.c_str());
            ++skipped;
            continue;
        }

        ScheduledClip placed;
        if (!place(*seg, clip, anchorTime, now, VoiceRoute::mixBus, placed))
            ++failed;
        lastPass_.push_back(placed);
    }

    RD_INFO("Scheduler::scheduleAll: %d placed (%d not started), %d skipped, anchor=%.3f, "
            "assembled end=%.3f",
            static_cast<int>(lastPass_.size()), failed, skipped, anchorTime, lastSegmentEnd_);
    return lastSegmentEnd_;
}

const std::vector<ScheduledClip>& Scheduler::getLastPass() const
{
    return lastPass_;
}

} // namespace redub
