#pragma once

#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <string>

namespace redub {

class ClipBuffer;
using ClipPtr = std::shared_ptr<const ClipBuffer>;

/// Decoded audio, immutable once built. Shared between the SegmentStore and
/// any voice still playing it, so replacing a store entry never pulls samples
/// out from under the audio thread.
class ClipBuffer {
public:
    /// Takes ownership of `data` via move. Returns nullptr for invalid parameters.
    static ClipPtr createFromData(juce::AudioBuffer<float>&& data, double sampleRate,
                                  const std::string& name = "");

    ~ClipBuffer();

    ClipBuffer(const ClipBuffer&) = delete;
    ClipBuffer& operator=(const ClipBuffer&) = delete;

    /// Returns read pointer for channel, or nullptr if channel is out of range.
    const float* getReadPointer(int channel) const;
    const juce::AudioBuffer<float>& getData() const { return data_; }

    int getNumChannels() const;
    int getLengthInSamples() const;
    double getSampleRate() const;
    double getDurationSeconds() const;
    const std::string& getName() const;

    /// Copy of this clip converted to `targetRate`. Returns the same clip when
    /// the rates already match.
    static ClipPtr resampled(const ClipPtr& clip, double targetRate);

private:
    ClipBuffer();

    juce::AudioBuffer<float> data_;
    double sampleRate_ = 0.0;
    std::string name_;
};

} // namespace redub
