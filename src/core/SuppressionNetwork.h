#pragma once

#include "core/Processor.h"

#include <atomic>

namespace redub {

/// Dialogue suppression for the original program audio.
///
///   in(L,R) -> backgroundVolume -+-> lowpass 250 Hz ----------------------+-> mono mix
///                                |                                         |
///                                +-> highpass 250 Hz -> L + (-R) -> x2.0 --+
///
/// The bass branch is kept as is (downmixed to mono). Above the crossover,
/// anything identical on both channels (center-panned dialogue) cancels and
/// only the stereo difference survives. Both filters are second order with
/// Q = 0.5, so the two branches sum without a bump at the crossover.
///
/// The topology is fixed; backgroundVolume is the only runtime parameter and
/// is ramped per sample so changes never click.
class SuppressionNetwork : public Processor {
public:
    static constexpr double kCrossoverHz = 250.0;
    static constexpr double kCrossoverQ = 0.5;
    static constexpr float kMakeupGain = 2.0f;
    static constexpr double kRampSeconds = 0.02;
    static constexpr float kDefaultBackgroundVolume = 0.15f;

    SuppressionNetwork();
    ~SuppressionNetwork() override;

    void prepare(double sampleRate, int blockSize) override;
    void reset() override;

    /// Reads the stereo program from channels 0/1 of `buffer` (a mono buffer
    /// is treated as L == R) and writes the suppressed mono result to
    /// channel 0.
    void process(juce::AudioBuffer<float>& buffer, int numSamples) override;

    // --- Control thread ---
    /// Clamped to [0, 1]. Takes effect from the next processed block.
    void setBackgroundVolume(float volume);
    float getBackgroundVolume() const;

private:
    std::atomic<float> targetVolume_{kDefaultBackgroundVolume};
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Linear> volume_;

    juce::IIRFilter lowLeft_, lowRight_;
    juce::IIRFilter highLeft_, highRight_;

    double sampleRate_ = 0.0;
};

} // namespace redub
