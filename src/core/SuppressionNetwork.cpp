#include "core/SuppressionNetwork.h"

#include <algorithm>

namespace redub {

SuppressionNetwork::SuppressionNetwork()
    : Processor("Suppression")
{
    volume_.setCurrentAndTargetValue(kDefaultBackgroundVolume);
}

SuppressionNetwork::~SuppressionNetwork() = default;

void SuppressionNetwork::prepare(double sampleRate, int /*blockSize*/)
{
    sampleRate_ = sampleRate;

    const auto low = juce::IIRCoefficients::makeLowPass(sampleRate, kCrossoverHz, kCrossoverQ);
    const auto high = juce::IIRCoefficients::makeHighPass(sampleRate, kCrossoverHz, kCrossoverQ);
    lowLeft_.setCoefficients(low);
    lowRight_.setCoefficients(low);
    highLeft_.setCoefficients(high);
    highRight_.setCoefficients(high);

    volume_.reset(sampleRate, kRampSeconds);
    volume_.setCurrentAndTargetValue(targetVolume_.load(std::memory_order_relaxed));
    reset();

    RD_INFO("SuppressionNetwork::prepare: sr=%.0f crossover=%.0f Hz Q=%.2f volume=%.2f",
            sampleRate, kCrossoverHz, kCrossoverQ,
            static_cast<double>(volume_.getTargetValue()));
}

void SuppressionNetwork::reset()
{
    lowLeft_.reset();
    lowRight_.reset();
    highLeft_.reset();
    highRight_.reset();
}

void SuppressionNetwork::process(juce::AudioBuffer<float>& buffer, int numSamples)
{
    numSamples = std::min(numSamples, buffer.getNumSamples());
    float* left = buffer.getWritePointer(0);
    const float* right = buffer.getNumChannels() > 1 ? buffer.getReadPointer(1) : left;

    const float target = targetVolume_.load(std::memory_order_relaxed);
    if (target != volume_.getTargetValue())
        volume_.setTargetValue(target);

    for (int i = 0; i < numSamples; ++i)
    {
        const float gain = volume_.getNextValue();
        const float l = left[i] * gain;
        const float r = right[i] * gain;

        const float bass = 0.5f * (lowLeft_.processSingleSampleRaw(l)
                                   + lowRight_.processSingleSampleRaw(r));
        const float side = highLeft_.processSingleSampleRaw(l)
                         - highRight_.processSingleSampleRaw(r);

        left[i] = bass + kMakeupGain * side;
    }
}

void SuppressionNetwork::setBackgroundVolume(float volume)
{
    volume = std::max(0.0f, std::min(1.0f, volume));
    targetVolume_.store(volume, std::memory_order_relaxed);
    RD_DEBUG("SuppressionNetwork::setBackgroundVolume: %.3f", static_cast<double>(volume));
}

float SuppressionNetwork::getBackgroundVolume() const
{
    return targetVolume_.load(std::memory_order_relaxed);
}

} // namespace redub
