#include "core/SegmentStore.h"
#include "core/BufferTrimmer.h"
#include "core/Logger.h"
#include "core/WavCodec.h"

#include <algorithm>

namespace redub {

SegmentStore::SegmentStore(double engineSampleRate)
    : sampleRate_(engineSampleRate)
{
    formatManager_.registerBasicFormats();
    RD_INFO("SegmentStore: initialized sr=%.0f with %d audio formats",
            sampleRate_, formatManager_.getNumKnownFormats());
}

SegmentStore::~SegmentStore()
{
    RD_DEBUG("SegmentStore: destroying with %d clips", size());
}

// ═══════════════════════════════════════════════════════════════════
// Storage
// ═══════════════════════════════════════════════════════════════════

bool SegmentStore::put(const std::string& segmentId, ClipPtr clip)
{
    if (!clip)
    {
        RD_WARN("SegmentStore::put: null clip for id=%s", segmentId.c_str());
        return false;
    }

    ClipPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = clips_[segmentId];
        previous = std::move(slot);
        slot = std::move(clip);
    }

    RD_DEBUG("SegmentStore::put: id=%s%s", segmentId.c_str(),
             previous ? " (replaced)" : "");
    return true;
}

ClipPtr SegmentStore::get(const std::string& segmentId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(segmentId);
    if (it == clips_.end())
        return nullptr;
    return it->second;
}

bool SegmentStore::has(const std::string& segmentId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return clips_.count(segmentId) > 0;
}

bool SegmentStore::remove(const std::string& segmentId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto erased = clips_.erase(segmentId);
    if (erased)
        RD_DEBUG("SegmentStore::remove: id=%s", segmentId.c_str());
    return erased > 0;
}

void SegmentStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    RD_INFO("SegmentStore::clear: releasing %d clips", static_cast<int>(clips_.size()));
    clips_.clear();
}

int SegmentStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(clips_.size());
}

std::vector<std::string> SegmentStore::getIds() const
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(clips_.size());
        for (const auto& [id, clip] : clips_)
            ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ═══════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════

ClipPtr SegmentStore::decode(const juce::MemoryBlock& encoded, const std::string& name,
                             std::string& error) const
{
    if (encoded.isEmpty())
    {
        error = "Empty audio data for " + name;
        RD_WARN("SegmentStore::decode: %s", error.c_str());
        return nullptr;
    }

    juce::AudioBuffer<float> data;
    double sourceRate = 0.0;

    // Wrapped synthesis output is read directly; anything else goes through
    // the registered formats.
    PcmClip pcm;
    std::string parseError;
    if (WavCodec::parsePcm16(encoded, pcm, parseError))
    {
        const int numFrames = static_cast<int>(pcm.samples.size()) / pcm.numChannels;
        data.setSize(pcm.numChannels, numFrames);
        for (int ch = 0; ch < pcm.numChannels; ++ch)
        {
            float* dest = data.getWritePointer(ch);
            for (int i = 0; i < numFrames; ++i)
                dest[i] = pcm.samples[static_cast<size_t>(i * pcm.numChannels + ch)] / 32768.0f;
        }
        sourceRate = pcm.sampleRate;
    }
    else
    {
        RD_TRACE("SegmentStore::decode: %s is not plain PCM16 (%s)", name.c_str(), parseError.c_str());

        std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(
            std::make_unique<juce::MemoryInputStream>(encoded, true)));
        if (!reader)
        {
            error = "Unsupported or corrupted audio data for " + name;
            RD_WARN("SegmentStore::decode: %s", error.c_str());
            return nullptr;
        }

        auto numChannels = static_cast<int>(reader->numChannels);
        auto numSamples = static_cast<int>(reader->lengthInSamples);
        if (numChannels > 0 && numSamples > 0)
        {
            data.setSize(numChannels, numSamples);
            if (!reader->read(&data, 0, numSamples, 0, true, true))
            {
                error = "Failed to read audio data for " + name;
                RD_WARN("SegmentStore::decode: %s", error.c_str());
                return nullptr;
            }
        }
        sourceRate = reader->sampleRate;
    }

    if (data.getNumChannels() < 1 || data.getNumSamples() < 1)
    {
        error = "Audio data for " + name + " holds no samples";
        RD_WARN("SegmentStore::decode: %s", error.c_str());
        return nullptr;
    }

    auto clip = ClipBuffer::resampled(
        ClipBuffer::createFromData(std::move(data), sourceRate, name), sampleRate_);
    if (!clip)
    {
        error = "Failed to build a clip for " + name;
        RD_WARN("SegmentStore::decode: %s", error.c_str());
    }
    return clip;
}

bool SegmentStore::decodeAndStore(const std::string& segmentId, const juce::MemoryBlock& encoded,
                                  std::string& error)
{
    auto clip = decode(encoded, segmentId, error);
    if (!clip)
        return false;

    clip = BufferTrimmer::trim(clip);
    RD_INFO("SegmentStore::decodeAndStore: id=%s, %.3f s after trim",
            segmentId.c_str(), clip->getDurationSeconds());
    return put(segmentId, std::move(clip));
}

} // namespace redub
