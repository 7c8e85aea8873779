#pragma once

#include <string>

namespace redub {

/// One line of dialogue on the source timeline. Its synthesized audio lives
/// in the SegmentStore under `id`.
struct DubSegment {
    std::string id;
    double startTime = 0.0;     // seconds
    double endTime = 0.0;       // seconds, > startTime
    std::string originalText;
    std::string translatedText;
    std::string speakerLabel;   // "Speaker 1", "Speaker 2", ...
    bool synthesizing = false;

    double getDuration() const { return endTime - startTime; }
};

} // namespace redub
