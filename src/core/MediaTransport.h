#pragma once

#include "core/ClipBuffer.h"
#include "core/Logger.h"

#include <cstdint>

namespace redub {

enum class TransportState { stopped, playing, paused };

/// The video's timeline as seen by the audio engine. Owned by the engine and
/// swapped in whole from the control thread.
struct ProgramMedia {
    ClipPtr audio;                  // null when the audio track could not be attached
    int64_t durationSamples = 0;    // video duration at the engine rate
};

/// Playhead over the video timeline. Audio thread only: the engine applies
/// control-thread requests through its command queue.
class MediaTransport {
public:
    MediaTransport();

    void prepare(double sampleRate, int blockSize);

    /// Installs new media, rewinds and stops. Returns the previous media so
    /// the caller can hand it back for deletion.
    const ProgramMedia* setMedia(const ProgramMedia* media);
    const ProgramMedia* getMedia() const;

    void play();
    void pause();
    void stop();
    void seek(int64_t samples);

    /// Writes the next `numSamples` of program audio into channels 0/1 of
    /// `dest` (silence where there is none, or when not playing) and moves
    /// the playhead. Returns true on the block in which the end is reached.
    bool renderAndAdvance(juce::AudioBuffer<float>& dest, int numSamples);

    TransportState getState() const;
    bool isPlaying() const;
    int64_t getPositionInSamples() const;
    double getPositionInSeconds() const;
    int64_t getDurationInSamples() const;

private:
    const ProgramMedia* media_ = nullptr;
    TransportState state_ = TransportState::stopped;
    int64_t positionInSamples_ = 0;
    double sampleRate_ = 0.0;
    int blockSize_ = 0;
};

} // namespace redub
