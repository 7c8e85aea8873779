#include "core/MediaTransport.h"

#include <algorithm>

namespace redub {

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

MediaTransport::MediaTransport()
{
    RD_DEBUG("MediaTransport: created (stopped, no media)");
}

void MediaTransport::prepare(double sampleRate, int blockSize)
{
    sampleRate_ = sampleRate;
    blockSize_ = blockSize;
    RD_INFO("MediaTransport: prepare sr=%.0f bs=%d", sampleRate_, blockSize_);
}

const ProgramMedia* MediaTransport::setMedia(const ProgramMedia* media)
{
    const ProgramMedia* previous = media_;
    media_ = media;
    state_ = TransportState::stopped;
    positionInSamples_ = 0;
    RD_DEBUG_RT("MediaTransport: media set (duration=%lld samples, audio=%s)",
                media ? (long long)media->durationSamples : 0LL,
                media && media->audio ? "yes" : "no");
    return previous;
}

const ProgramMedia* MediaTransport::getMedia() const { return media_; }

// ═══════════════════════════════════════════════════════════════════
// State control
// ═══════════════════════════════════════════════════════════════════

void MediaTransport::play()
{
    if (state_ == TransportState::playing) return;

    const int64_t duration = getDurationInSamples();
    if (duration <= 0)
    {
        RD_WARN_RT("MediaTransport: play ignored, no media");
        return;
    }
    if (positionInSamples_ >= duration)
        positionInSamples_ = 0;

    RD_DEBUG_RT("MediaTransport: play from sample %lld", (long long)positionInSamples_);
    state_ = TransportState::playing;
}

void MediaTransport::pause()
{
    if (state_ != TransportState::playing) return;
    RD_DEBUG_RT("MediaTransport: pause at sample %lld", (long long)positionInSamples_);
    state_ = TransportState::paused;
}

void MediaTransport::stop()
{
    RD_DEBUG_RT("MediaTransport: stop");
    state_ = TransportState::stopped;
    positionInSamples_ = 0;
}

void MediaTransport::seek(int64_t samples)
{
    positionInSamples_ = std::clamp(samples, int64_t(0), getDurationInSamples());
    RD_DEBUG_RT("MediaTransport: seek to sample %lld", (long long)positionInSamples_);
}

// ═══════════════════════════════════════════════════════════════════
// renderAndAdvance (audio thread)
// ═══════════════════════════════════════════════════════════════════

bool MediaTransport::renderAndAdvance(juce::AudioBuffer<float>& dest, int numSamples)
{
    dest.clear(0, numSamples);

    if (state_ != TransportState::playing || numSamples <= 0)
        return false;

    const int64_t duration = getDurationInSamples();
    const int64_t remaining = duration - positionInSamples_;
    const int count = static_cast<int>(std::min<int64_t>(numSamples, std::max<int64_t>(remaining, 0)));

    if (media_->audio && count > 0)
    {
        const ClipBuffer& audio = *media_->audio;
        const int64_t available = audio.getLengthInSamples() - positionInSamples_;
        const int copyCount = static_cast<int>(std::min<int64_t>(count, std::max<int64_t>(available, 0)));
        if (copyCount > 0)
        {
            const int start = static_cast<int>(positionInSamples_);
            const int srcRight = audio.getNumChannels() > 1 ? 1 : 0;
            dest.copyFrom(0, 0, audio.getData(), 0, start, copyCount);
            if (dest.getNumChannels() > 1)
                dest.copyFrom(1, 0, audio.getData(), srcRight, start, copyCount);
        }
    }

    positionInSamples_ += count;

    if (positionInSamples_ >= duration)
    {
        state_ = TransportState::paused;
        RD_DEBUG_RT("MediaTransport: reached end at sample %lld", (long long)positionInSamples_);
        return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

TransportState MediaTransport::getState() const { return state_; }
bool MediaTransport::isPlaying() const { return state_ == TransportState::playing; }
int64_t MediaTransport::getPositionInSamples() const { return positionInSamples_; }

double MediaTransport::getPositionInSeconds() const
{
    if (sampleRate_ <= 0.0) return 0.0;
    return static_cast<double>(positionInSamples_) / sampleRate_;
}

int64_t MediaTransport::getDurationInSamples() const
{
    return media_ ? media_->durationSamples : 0;
}

} // namespace redub
