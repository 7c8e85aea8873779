#include "core/AudioDevice.h"
#include "core/Logger.h"

namespace redub {

AudioDevice::AudioDevice(AudioEngine& engine)
    : engine_(engine)
{
    RD_DEBUG("AudioDevice: created");
}

AudioDevice::~AudioDevice()
{
    stop();
}

// ═══════════════════════════════════════════════════════════════════
// Control thread
// ═══════════════════════════════════════════════════════════════════

bool AudioDevice::start(std::string& error)
{
    stop();

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    setup.sampleRate = engine_.getSampleRate();
    setup.bufferSize = engine_.getBlockSize();

    auto err = deviceManager_.initialise(0, 2, nullptr, true, {}, &setup);
    if (err.isNotEmpty())
    {
        error = err.toStdString();
        RD_WARN("AudioDevice::start: cannot open output: %s", error.c_str());
        return false;
    }

    deviceManager_.addAudioCallback(this);
    RD_INFO("AudioDevice::start: %s", getDeviceName().c_str());
    return true;
}

void AudioDevice::stop()
{
    if (deviceManager_.getCurrentAudioDevice() == nullptr)
        return;

    const int xruns = getXRunCount();
    if (xruns > 0)
        RD_WARN("AudioDevice::stop: %d underruns, the monitor output may have glitched", xruns);
    RD_INFO("AudioDevice::stop");
    deviceManager_.removeAudioCallback(this);
    deviceManager_.closeAudioDevice();
    running_.store(false);
}

bool AudioDevice::isRunning() const
{
    return running_.load();
}

int AudioDevice::getXRunCount() const
{
    auto* device = deviceManager_.getCurrentAudioDevice();
    return device ? device->getXRunCount() : -1;
}

std::string AudioDevice::getDeviceName() const
{
    auto* device = deviceManager_.getCurrentAudioDevice();
    return device ? device->getName().toStdString() : std::string();
}

double AudioDevice::getSampleRate() const
{
    return running_.load() ? sampleRate_ : 0.0;
}

int AudioDevice::getBlockSize() const
{
    return running_.load() ? blockSize_ : 0;
}

// ═══════════════════════════════════════════════════════════════════
// JUCE AudioIODeviceCallback
// ═══════════════════════════════════════════════════════════════════

void AudioDevice::audioDeviceIOCallbackWithContext(
    const float* const* /*inputChannelData*/, int /*numInputChannels*/,
    float* const* outputChannelData, int numOutputChannels,
    int numSamples,
    const juce::AudioIODeviceCallbackContext& /*context*/)
{
    engine_.processBlock(outputChannelData, numOutputChannels, numSamples);
}

void AudioDevice::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    sampleRate_ = device->getCurrentSampleRate();
    blockSize_ = device->getCurrentBufferSizeSamples();

    // The engine clock counts samples at the engine rate; a device running
    // at another rate makes scheduled voices drift against the transport.
    if (sampleRate_ != engine_.getSampleRate())
        RD_WARN("AudioDevice: device runs at %.0f Hz, engine at %.0f Hz",
                sampleRate_, engine_.getSampleRate());

    RD_INFO("AudioDevice::audioDeviceAboutToStart: sr=%.0f bs=%d", sampleRate_, blockSize_);
    running_.store(true);
}

void AudioDevice::audioDeviceStopped()
{
    RD_INFO("AudioDevice::audioDeviceStopped");
    running_.store(false);
}

} // namespace redub
