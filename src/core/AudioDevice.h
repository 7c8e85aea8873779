#pragma once

#include "core/AudioEngine.h"

#include <juce_audio_devices/juce_audio_devices.h>

#include <atomic>
#include <string>

namespace redub {

/// Plays an AudioEngine through the default output device (the monitor
/// sink). Device blocks of any size are handed to AudioEngine::processBlock,
/// which splits them into engine-sized chunks.
class AudioDevice : public juce::AudioIODeviceCallback {
public:
    explicit AudioDevice(AudioEngine& engine);
    ~AudioDevice() override;

    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    // --- Control thread ---
    /// Opens a stereo output at the engine's sample rate and block size.
    bool start(std::string& error);
    void stop();
    bool isRunning() const;
    std::string getDeviceName() const;
    /// Buffer underruns reported by the device since it opened, or -1 when
    /// the driver does not count them.
    int getXRunCount() const;
    double getSampleRate() const;
    int getBlockSize() const;

    // --- JUCE AudioIODeviceCallback (audio thread) ---
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData, int numInputChannels,
        float* const* outputChannelData, int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    AudioEngine& engine_;
    juce::AudioDeviceManager deviceManager_;
    std::atomic<bool> running_{false};
    double sampleRate_ = 0.0;
    int blockSize_ = 0;
};

} // namespace redub
