#include "core/ClipBuffer.h"

#include <algorithm>
#include <cmath>

namespace redub {

ClipBuffer::ClipBuffer() = default;
ClipBuffer::~ClipBuffer() = default;

ClipPtr ClipBuffer::createFromData(juce::AudioBuffer<float>&& data, double sampleRate,
                                   const std::string& name)
{
    if (data.getNumChannels() < 1 || data.getNumSamples() < 1 || sampleRate <= 0.0)
    {
        RD_WARN("ClipBuffer::createFromData: invalid params (ch=%d, len=%d, sr=%.1f)",
                data.getNumChannels(), data.getNumSamples(), sampleRate);
        return nullptr;
    }

    std::shared_ptr<ClipBuffer> clip(new ClipBuffer());
    clip->data_ = std::move(data);
    clip->sampleRate_ = sampleRate;
    clip->name_ = name;

    RD_DEBUG("ClipBuffer::createFromData: name=%s, ch=%d, len=%d, sr=%.1f",
             name.c_str(), clip->data_.getNumChannels(), clip->data_.getNumSamples(),
             sampleRate);
    return clip;
}

const float* ClipBuffer::getReadPointer(int channel) const
{
    if (channel < 0 || channel >= data_.getNumChannels())
        return nullptr;
    return data_.getReadPointer(channel);
}

int ClipBuffer::getNumChannels() const { return data_.getNumChannels(); }
int ClipBuffer::getLengthInSamples() const { return data_.getNumSamples(); }
double ClipBuffer::getSampleRate() const { return sampleRate_; }
const std::string& ClipBuffer::getName() const { return name_; }

double ClipBuffer::getDurationSeconds() const
{
    return static_cast<double>(data_.getNumSamples()) / sampleRate_;
}

ClipPtr ClipBuffer::resampled(const ClipPtr& clip, double targetRate)
{
    if (!clip || targetRate <= 0.0 || clip->sampleRate_ == targetRate)
        return clip;

    const double ratio = clip->sampleRate_ / targetRate;
    const int inLength = clip->getLengthInSamples();
    const int outLength = std::max(1, static_cast<int>(std::ceil(inLength / ratio)));

    juce::AudioBuffer<float> out(clip->getNumChannels(), outLength);
    for (int ch = 0; ch < clip->getNumChannels(); ++ch)
    {
        juce::LagrangeInterpolator interpolator;
        interpolator.process(ratio, clip->data_.getReadPointer(ch), out.getWritePointer(ch),
                             outLength, inLength, 0);
    }

    RD_DEBUG("ClipBuffer::resampled: name=%s %.1f -> %.1f Hz, len %d -> %d",
             clip->name_.c_str(), clip->sampleRate_, targetRate, inLength, outLength);
    return createFromData(std::move(out), targetRate, clip->name_);
}

} // namespace redub
