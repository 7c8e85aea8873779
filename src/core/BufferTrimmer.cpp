#include "core/BufferTrimmer.h"

#include <cmath>

namespace redub {

ClipPtr BufferTrimmer::trim(const ClipPtr& clip)
{
    if (!clip)
        return clip;

    const float* data = clip->getReadPointer(0);
    const int length = clip->getLengthInSamples();

    int start = 0;
    int end = length;
    bool found = false;
    for (int i = 0; i < length; ++i)
    {
        if (std::abs(data[i]) > kThreshold) { start = i; found = true; break; }
    }
    for (int i = length - 1; found && i >= 0; --i)
    {
        if (std::abs(data[i]) > kThreshold) { end = i + 1; break; }
    }

    if (!found || end <= start)
    {
        RD_DEBUG("BufferTrimmer::trim: %s has no signal above %.2f, left as is",
                 clip->getName().c_str(), static_cast<double>(kThreshold));
        return clip;
    }
    if (start == 0 && end == length)
        return clip;

    const int newLength = end - start;
    juce::AudioBuffer<float> trimmed(clip->getNumChannels(), newLength);
    for (int ch = 0; ch < clip->getNumChannels(); ++ch)
        trimmed.copyFrom(ch, 0, clip->getData(), ch, start, newLength);

    RD_DEBUG("BufferTrimmer::trim: %s [%d, %d) of %d samples",
             clip->getName().c_str(), start, end, length);
    return ClipBuffer::createFromData(std::move(trimmed), clip->getSampleRate(), clip->getName());
}

} // namespace redub
