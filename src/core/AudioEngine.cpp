#include "core/AudioEngine.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace redub {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

AudioEngine::AudioEngine(const EngineConfig& config)
    : sampleRate_(config.sampleRate), blockSize_(std::max(1, config.blockSize))
{
    formatManager_.registerBasicFormats();

    transport_.prepare(sampleRate_, blockSize_);
    suppression_.setBackgroundVolume(config.backgroundVolume);
    suppression_.prepare(sampleRate_, blockSize_);

    programScratch_.setSize(2, blockSize_);
    mixBus_.setSize(1, blockSize_);
    previewBus_.setSize(1, blockSize_);

    RD_INFO("AudioEngine: created sr=%.0f bs=%d backgroundVolume=%.2f",
            sampleRate_, blockSize_, static_cast<double>(config.backgroundVolume));
}

AudioEngine::~AudioEngine()
{
    for (int i = 0; i < numVoices_; ++i)
        delete voices_[i];
    numVoices_ = 0;

    for (auto* voice : pendingVoices_)
        delete voice;
    pendingVoices_.clear();

    delete transport_.setMedia(nullptr);

    // Commands nobody processed still own heap objects
    commandQueue_.processPending([](const Command& cmd) {
        if (cmd.type == Command::Type::startVoice)
            delete static_cast<Voice*>(cmd.ptr);
        else if (cmd.type == Command::Type::swapProgram)
            delete static_cast<ProgramMedia*>(cmd.ptr);
    });
    commandQueue_.collectGarbage();
    Logger::drain();
    RD_INFO("AudioEngine: destroyed");
}

double AudioEngine::getSampleRate() const { return sampleRate_; }
int AudioEngine::getBlockSize() const { return blockSize_; }

// ═══════════════════════════════════════════════════════════════════
// Control-thread helpers
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::collectGarbage()
{
    int count = commandQueue_.collectGarbage();
    if (count > 0)
        RD_TRACE("AudioEngine: collected %d garbage items", count);
    Logger::drain();
}

void AudioEngine::dispatchDueVoices(int64_t horizonSamples)
{
    auto it = pendingVoices_.begin();
    for (; it != pendingVoices_.end() && (*it)->getStartSample() < horizonSamples; ++it)
    {
        Command cmd;
        cmd.type = Command::Type::startVoice;
        cmd.ptr = *it;
        if (!commandQueue_.sendCommand(cmd))
        {
            RD_WARN("AudioEngine: command queue full, voice %d held back", (*it)->getId());
            break;
        }
        RD_TRACE("AudioEngine: voice %d handed to the audio thread", (*it)->getId());
    }
    pendingVoices_.erase(pendingVoices_.begin(), it);
}

void AudioEngine::sendOrWarn(const Command& cmd)
{
    if (!commandQueue_.sendCommand(cmd))
        RD_WARN("AudioEngine: %s not delivered", commandTypeName(cmd.type));
}

// ═══════════════════════════════════════════════════════════════════
// Program audio
// ═══════════════════════════════════════════════════════════════════

bool AudioEngine::attachProgramAudio(const juce::File& mediaFile, double videoDurationSeconds,
                                     std::string& error)
{
    ClipPtr audio;
    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(mediaFile));
    if (!reader || reader->lengthInSamples < 1)
    {
        error = "Cannot attach to the audio track of " + mediaFile.getFullPathName().toStdString();
    }
    else
    {
        auto numSamples = static_cast<int>(reader->lengthInSamples);
        juce::AudioBuffer<float> data(static_cast<int>(reader->numChannels), numSamples);
        if (reader->read(&data, 0, numSamples, 0, true, true))
            audio = ClipBuffer::createFromData(std::move(data), reader->sampleRate,
                                               mediaFile.getFileName().toStdString());
        else
            error = "Failed to read the audio track of " + mediaFile.getFullPathName().toStdString();
    }

    if (!audio)
    {
        attachProgramAudio(ClipPtr(), videoDurationSeconds, error);
        return false;
    }
    return attachProgramAudio(std::move(audio), videoDurationSeconds, error);
}

bool AudioEngine::attachProgramAudio(ClipPtr programAudio, double videoDurationSeconds,
                                     std::string& error)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    collectGarbage();

    auto* media = new ProgramMedia();
    media->audio = ClipBuffer::resampled(programAudio, sampleRate_);

    double duration = videoDurationSeconds;
    if (duration <= 0.0 && media->audio)
        duration = media->audio->getDurationSeconds();
    media->durationSamples = static_cast<int64_t>(std::llround(std::max(0.0, duration) * sampleRate_));

    const bool attached = media->audio != nullptr;
    if (!attached)
    {
        if (error.empty())
            error = "No audio track to attach";
        RD_WARN("AudioEngine::attachProgramAudio: %s; suppression unavailable, "
                "program audio muted for %.3f s of video", error.c_str(), duration);
    }
    else
    {
        RD_INFO("AudioEngine::attachProgramAudio: %s, %d ch, duration=%.3f s",
                media->audio->getName().c_str(), media->audio->getNumChannels(), duration);
    }

    mediaDurationSeconds_ = duration;
    suppressionAvailable_ = attached;
    installMedia(media);
    return attached;
}

void AudioEngine::detachProgramAudio()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    collectGarbage();
    mediaDurationSeconds_ = 0.0;
    suppressionAvailable_ = false;
    installMedia(nullptr);
    RD_INFO("AudioEngine::detachProgramAudio");
}

void AudioEngine::installMedia(ProgramMedia* media)
{
    Command cmd;
    cmd.type = Command::Type::swapProgram;
    cmd.ptr = media;
    if (!commandQueue_.sendCommand(cmd))
    {
        RD_WARN("AudioEngine::installMedia: command queue full, media dropped");
        delete media;
    }
}

bool AudioEngine::isSuppressionAvailable() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return suppressionAvailable_;
}

double AudioEngine::getMediaDuration() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return mediaDurationSeconds_;
}

// ═══════════════════════════════════════════════════════════════════
// Suppression
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::setBackgroundVolume(float volume)
{
    suppression_.setBackgroundVolume(volume);
}

float AudioEngine::getBackgroundVolume() const
{
    return suppression_.getBackgroundVolume();
}

// ═══════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::transportPlay()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    sendOrWarn({Command::Type::transportPlay});
}

void AudioEngine::transportPause()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    sendOrWarn({Command::Type::transportPause});
}

void AudioEngine::transportStop()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    sendOrWarn({Command::Type::transportStop});
}

void AudioEngine::transportSeek(double seconds)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    Command cmd;
    cmd.type = Command::Type::transportSeek;
    cmd.int64Value = static_cast<int64_t>(std::llround(std::max(0.0, seconds) * sampleRate_));
    sendOrWarn(cmd);
}

double AudioEngine::getTransportPosition() const
{
    return static_cast<double>(publishedPosition_.load(std::memory_order_relaxed)) / sampleRate_;
}

TransportState AudioEngine::getTransportState() const
{
    return static_cast<TransportState>(publishedState_.load(std::memory_order_relaxed));
}

bool AudioEngine::isTransportPlaying() const
{
    return getTransportState() == TransportState::playing;
}

// ═══════════════════════════════════════════════════════════════════
// Voices
// ═══════════════════════════════════════════════════════════════════

int AudioEngine::startVoice(ClipPtr clip, double startTime, VoiceRoute route)
{
    if (!clip)
    {
        RD_WARN("AudioEngine::startVoice: null clip");
        return -1;
    }

    std::lock_guard<std::mutex> lock(controlMutex_);
    collectGarbage();

    const int id = nextVoiceId_++;
    const auto startSample = static_cast<int64_t>(std::llround(startTime * sampleRate_));
    auto* voice = new Voice(id, std::move(clip), startSample, route);

    auto pos = std::upper_bound(pendingVoices_.begin(), pendingVoices_.end(), startSample,
                                [](int64_t s, const Voice* v) { return s < v->getStartSample(); });
    pendingVoices_.insert(pos, voice);

    const auto lookahead = static_cast<int64_t>(kVoiceLookaheadSeconds * sampleRate_);
    dispatchDueVoices(getCurrentSample() + lookahead);

    RD_DEBUG("AudioEngine::startVoice: id=%d at %.4f s (sample %lld) route=%s",
             id, startTime, (long long)startSample,
             route == VoiceRoute::mixBus ? "mix" : "monitor");
    return id;
}

void AudioEngine::stopVoice(int voiceId)
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    auto it = std::find_if(pendingVoices_.begin(), pendingVoices_.end(),
                           [voiceId](const Voice* v) { return v->getId() == voiceId; });
    if (it != pendingVoices_.end())
    {
        cancelledEvents_.push_back({EngineEvent::Type::voiceEnded, voiceId, getCurrentSample()});
        delete *it;
        pendingVoices_.erase(it);
        return;
    }

    Command cmd;
    cmd.type = Command::Type::stopVoice;
    cmd.intValue = voiceId;
    sendOrWarn(cmd);
}

void AudioEngine::stopAllVoices()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    for (auto* voice : pendingVoices_)
    {
        cancelledEvents_.push_back({EngineEvent::Type::voiceEnded, voice->getId(), getCurrentSample()});
        delete voice;
    }
    pendingVoices_.clear();
    sendOrWarn({Command::Type::stopAllVoices});
}

int AudioEngine::getActiveVoiceCount() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return publishedVoiceCount_.load(std::memory_order_relaxed)
        + static_cast<int>(pendingVoices_.size());
}

// ═══════════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::setMonitorGain(float gain)
{
    monitorGain_.store(std::max(0.0f, gain), std::memory_order_relaxed);
    RD_DEBUG("AudioEngine::setMonitorGain: %.2f", static_cast<double>(gain));
}

float AudioEngine::getMonitorGain() const
{
    return monitorGain_.load(std::memory_order_relaxed);
}

void AudioEngine::setCaptureSink(StreamRecorder* recorder)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    Command cmd;
    cmd.type = Command::Type::setCaptureSink;
    cmd.ptr = recorder;
    sendOrWarn(cmd);
}

// ═══════════════════════════════════════════════════════════════════
// Clock and completions
// ═══════════════════════════════════════════════════════════════════

double AudioEngine::getCurrentTime() const
{
    return static_cast<double>(getCurrentSample()) / sampleRate_;
}

int64_t AudioEngine::getCurrentSample() const
{
    return publishedClock_.load(std::memory_order_acquire);
}

int AudioEngine::pollEvents(std::vector<EngineEvent>& events)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    collectGarbage();

    const auto lookahead = static_cast<int64_t>(kVoiceLookaheadSeconds * sampleRate_);
    dispatchDueVoices(getCurrentSample() + lookahead);

    int count = static_cast<int>(cancelledEvents_.size());
    events.insert(events.end(), cancelledEvents_.begin(), cancelledEvents_.end());
    cancelledEvents_.clear();
    return count + commandQueue_.drainEvents([&events](const EngineEvent& ev) { events.push_back(ev); });
}

// ═══════════════════════════════════════════════════════════════════
// Command handling (audio thread)
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::handleCommand(const Command& cmd)
{
    switch (cmd.type)
    {
        case Command::Type::swapProgram:
        {
            const auto* old = transport_.setMedia(static_cast<const ProgramMedia*>(cmd.ptr));
            suppression_.reset();
            if (old)
                commandQueue_.sendGarbage(GarbageItem::wrap(const_cast<ProgramMedia*>(old)));
            break;
        }
        case Command::Type::transportPlay:
            transport_.play();
            break;
        case Command::Type::transportPause:
            transport_.pause();
            break;
        case Command::Type::transportStop:
            transport_.stop();
            break;
        case Command::Type::transportSeek:
            transport_.seek(cmd.int64Value);
            break;
        case Command::Type::startVoice:
        {
            auto* voice = static_cast<Voice*>(cmd.ptr);
            if (numVoices_ >= kMaxVoices)
            {
                RD_WARN_RT("AudioEngine: voice table full, dropping voice %d", voice->getId());
                voice->stop();
                commandQueue_.postEvent({EngineEvent::Type::voiceEnded, voice->getId(), clockSamples_});
                commandQueue_.sendGarbage(GarbageItem::wrap(voice));
                break;
            }
            voices_[numVoices_++] = voice;
            break;
        }
        case Command::Type::stopVoice:
        {
            for (int i = 0; i < numVoices_; ++i)
            {
                if (voices_[i]->getId() == cmd.intValue)
                {
                    voices_[i]->stop();
                    break;
                }
            }
            break;
        }
        case Command::Type::stopAllVoices:
            for (int i = 0; i < numVoices_; ++i)
                voices_[i]->stop();
            break;
        case Command::Type::setCaptureSink:
            captureSink_ = static_cast<StreamRecorder*>(cmd.ptr);
            RD_DEBUG_RT("AudioEngine: capture sink %s", captureSink_ ? "attached" : "detached");
            break;
    }
}

// ═══════════════════════════════════════════════════════════════════
// processBlock (audio thread)
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::processBlock(float* const* outputChannels, int numChannels, int numSamples)
{
    commandQueue_.processPending([this](const Command& cmd) { handleCommand(cmd); });

    for (int offset = 0; offset < numSamples; offset += blockSize_)
        processChunk(outputChannels, numChannels, offset, std::min(blockSize_, numSamples - offset));

    publishedPosition_.store(transport_.getPositionInSamples(), std::memory_order_relaxed);
    publishedState_.store(static_cast<int>(transport_.getState()), std::memory_order_relaxed);
    publishedVoiceCount_.store(numVoices_, std::memory_order_relaxed);
    publishedClock_.store(clockSamples_, std::memory_order_release);
}

void AudioEngine::processChunk(float* const* outputChannels, int numChannels,
                               int offset, int numSamples)
{
    // 1. Program audio through the suppression network onto the mix bus
    const bool ended = transport_.renderAndAdvance(programScratch_, numSamples);
    suppression_.process(programScratch_, numSamples);
    mixBus_.copyFrom(0, 0, programScratch_, 0, 0, numSamples);
    previewBus_.clear(0, numSamples);

    // 2. Voices
    float* mix = mixBus_.getWritePointer(0);
    float* preview = previewBus_.getWritePointer(0);
    for (int i = numVoices_ - 1; i >= 0; --i)
    {
        Voice* voice = voices_[i];
        float* dest = voice->getRoute() == VoiceRoute::mixBus ? mix : preview;
        if (voice->render(dest, numSamples, clockSamples_))
            retireVoice(i);
    }

    clockSamples_ += numSamples;
    if (ended)
        commandQueue_.postEvent({EngineEvent::Type::transportEnded, -1, clockSamples_});

    // 3. Capture sink gets the mix bus only
    if (captureSink_)
    {
        const float* channels[1] = {mix};
        captureSink_->writeAudio(channels, 1, numSamples);
    }

    // 4. Monitor
    const float gain = monitorGain_.load(std::memory_order_relaxed);
    for (int ch = 0; ch < numChannels; ++ch)
    {
        float* out = outputChannels[ch] + offset;
        juce::FloatVectorOperations::copyWithMultiply(out, mix, gain, numSamples);
        juce::FloatVectorOperations::addWithMultiply(out, preview, gain, numSamples);
    }
}

void AudioEngine::retireVoice(int index)
{
    Voice* voice = voices_[index];
    voices_[index] = voices_[--numVoices_];
    voices_[numVoices_] = nullptr;

    RD_TRACE_RT("AudioEngine: voice %d ended", voice->getId());
    commandQueue_.postEvent({EngineEvent::Type::voiceEnded, voice->getId(), clockSamples_});
    commandQueue_.sendGarbage(GarbageItem::wrap(voice));
}

// ═══════════════════════════════════════════════════════════════════
// Offline rendering / testing
// ═══════════════════════════════════════════════════════════════════

void AudioEngine::render(juce::AudioBuffer<float>& output)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    const auto lookahead = static_cast<int64_t>(kVoiceLookaheadSeconds * sampleRate_);
    dispatchDueVoices(getCurrentSample() + output.getNumSamples() + lookahead);
    processBlock(output.getArrayOfWritePointers(), output.getNumChannels(), output.getNumSamples());
    RD_TRACE("AudioEngine::render: %d samples", output.getNumSamples());
}

void AudioEngine::render(int numSamples)
{
    juce::AudioBuffer<float> output(2, numSamples);
    output.clear();
    render(output);
}

} // namespace redub
