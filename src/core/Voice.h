#pragma once

#include "core/ClipBuffer.h"

#include <cstdint>

namespace redub {

enum class VoiceRoute {
    mixBus,         // monitor + capture
    monitorOnly     // preview: speakers only, never recorded
};

/// One in-flight playback of a clip, starting at an absolute engine-clock
/// sample. Built on the control thread, rendered and retired on the audio
/// thread, deleted back on the control thread.
class Voice {
public:
    Voice(int id, ClipPtr clip, int64_t startSample, VoiceRoute route);

    Voice(const Voice&) = delete;
    Voice& operator=(const Voice&) = delete;

    int getId() const { return id_; }
    VoiceRoute getRoute() const { return route_; }
    int64_t getStartSample() const { return startSample_; }

    /// Mixes (adds) the clip, downmixed to mono, into `dest` for the block
    /// that starts at engine sample `blockStart`. A start time already in
    /// the past plays from offset 0. Returns true once the clip is done.
    bool render(float* dest, int numSamples, int64_t blockStart);

    void stop() { stopped_ = true; }
    bool isFinished() const;

private:
    int id_;
    ClipPtr clip_;
    int64_t startSample_;
    VoiceRoute route_;
    int position_ = 0;
    bool stopped_ = false;
};

} // namespace redub
