#pragma once

#include <juce_core/juce_core.h>

#include <string>

namespace redub {

struct RecordingRequest {
    juce::File outputFile;
    std::string mimeType;           // e.g. "video/webm;codecs=vp9"
    double sampleRate = 0.0;        // of the mixed audio pushed via writeAudio()
    int numAudioChannels = 1;
};

/// Platform capture of the video track muxed with the engine's mixed audio.
///
/// Capability queries and start/stop run on the control thread.
/// writeAudio() runs on the audio thread: it must not block or allocate, and
/// must tolerate being called once more after stop() returned.
class StreamRecorder {
public:
    virtual ~StreamRecorder() = default;

    /// Whether this runtime can produce one stream of video + mixed audio.
    virtual bool canCaptureCombinedStream() const = 0;
    virtual bool isTypeSupported(const std::string& mimeType) const = 0;

    virtual bool start(const RecordingRequest& request, std::string& error) = 0;
    virtual void writeAudio(const float* const* channels, int numChannels, int numSamples) = 0;
    virtual void stop() = 0;
    virtual bool isRecording() const = 0;
};

} // namespace redub
