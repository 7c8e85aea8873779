#pragma once

#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <string>

namespace redub {

/// Block processor living on the audio thread. Settings are written from
/// the control thread and must be safe to read while process() runs.
class Processor {
public:
    explicit Processor(const std::string& name)
        : name_(name)
    {
        RD_DEBUG("Processor created: name=%s", name_.c_str());
    }

    virtual ~Processor() = default;

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    // --- Lifecycle (control thread) ---
    virtual void prepare(double sampleRate, int blockSize) = 0;
    virtual void reset() {}

    // --- Processing (audio thread, RT-safe) ---
    virtual void process(juce::AudioBuffer<float>& buffer, int numSamples) = 0;

    const std::string& getName() const { return name_; }

private:
    std::string name_;
};

} // namespace redub
