#include "core/Voice.h"

#include <algorithm>

namespace redub {

Voice::Voice(int id, ClipPtr clip, int64_t startSample, VoiceRoute route)
    : id_(id), clip_(std::move(clip)), startSample_(startSample), route_(route)
{
}

bool Voice::isFinished() const
{
    return stopped_ || !clip_ || position_ >= clip_->getLengthInSamples();
}

bool Voice::render(float* dest, int numSamples, int64_t blockStart)
{
    if (isFinished())
        return true;

    const int64_t blockEnd = blockStart + numSamples;
    if (position_ == 0 && startSample_ >= blockEnd)
        return false;

    const int offset = position_ == 0
        ? static_cast<int>(std::max<int64_t>(0, startSample_ - blockStart))
        : 0;
    const int count = std::min(numSamples - offset, clip_->getLengthInSamples() - position_);

    const int numChannels = clip_->getNumChannels();
    const float scale = 1.0f / static_cast<float>(numChannels);
    for (int ch = 0; ch < numChannels; ++ch)
    {
        const float* src = clip_->getReadPointer(ch) + position_;
        for (int i = 0; i < count; ++i)
            dest[offset + i] += src[i] * scale;
    }

    position_ += count;
    return isFinished();
}

} // namespace redub
