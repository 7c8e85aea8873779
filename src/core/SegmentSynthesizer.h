#pragma once

#include "core/DubProject.h"
#include "core/Services.h"

#include <string>

namespace redub {

/// Turns a segment's translated text into a stored, trimmed clip:
/// synthesize -> wrap in WAV -> decode -> trim -> SegmentStore.
class SegmentSynthesizer {
public:
    SegmentSynthesizer(DubProject& project, SynthesisService& service);

    /// Failure (service or decode) leaves the segment without audio and
    /// clears its synthesizing flag; it is never fatal to the session.
    bool synthesize(const std::string& segmentId, std::string& error);

    /// Synthesize every segment that has no audio yet, one after another.
    /// Returns the number of segments that still have no audio afterwards.
    int synthesizeMissing();

private:
    DubProject& project_;
    SynthesisService& service_;
};

} // namespace redub
