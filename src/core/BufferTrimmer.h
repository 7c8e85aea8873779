#pragma once

#include "core/ClipBuffer.h"

namespace redub {

/// Strips leading and trailing near-silence from synthesized speech so the
/// scheduler places the audible part, not the dead air around it.
class BufferTrimmer {
public:
    /// Absolute amplitude a sample must exceed to count as signal.
    static constexpr float kThreshold = 0.02f;

    /// Returns a clip covering [first loud sample, last loud sample] of
    /// channel 0, applied to every channel. Returns `clip` itself when
    /// nothing is loud or when there is nothing to remove.
    static ClipPtr trim(const ClipPtr& clip);
};

} // namespace redub
