#pragma once

#include "core/CommandQueue.h"
#include "core/MediaTransport.h"
#include "core/StreamRecorder.h"
#include "core/SuppressionNetwork.h"
#include "core/Voice.h"

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace redub {

struct EngineConfig {
    double sampleRate = 48000.0;
    int blockSize = 512;
    float backgroundVolume = SuppressionNetwork::kDefaultBackgroundVolume;
};

/// The real-time audio engine of one open project.
///
/// Signal flow per block:
///
///   program audio -> SuppressionNetwork -+-> mix bus -+-> capture sink (recorder)
///   scheduled voices ---------------------+            |
///                                                     +-> x monitorGain -> device
///   preview voice ------------------------------------+
///
/// Control-thread calls are queued as commands and applied at the top of the
/// next block; completions come back through pollEvents(). The engine clock
/// (getCurrentTime) runs whenever blocks are processed, independent of the
/// media transport.
class AudioEngine {
public:
    explicit AudioEngine(const EngineConfig& config = EngineConfig());
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    double getSampleRate() const;
    int getBlockSize() const;

    // --- Program audio (control thread) ---
    /// Decode the video's audio track and feed it through suppression. When
    /// the track cannot be read, the transport still runs for
    /// `videoDurationSeconds` with the program muted and false is returned.
    /// A non-positive duration means "use the audio track's length".
    bool attachProgramAudio(const juce::File& mediaFile, double videoDurationSeconds,
                            std::string& error);
    bool attachProgramAudio(ClipPtr programAudio, double videoDurationSeconds,
                            std::string& error);
    void detachProgramAudio();
    bool isSuppressionAvailable() const;
    double getMediaDuration() const;

    // --- Suppression (control thread) ---
    void setBackgroundVolume(float volume);
    float getBackgroundVolume() const;

    // --- Transport (control thread) ---
    void transportPlay();
    void transportPause();
    void transportStop();
    void transportSeek(double seconds);

    double getTransportPosition() const;
    TransportState getTransportState() const;
    bool isTransportPlaying() const;

    // --- Voices (control thread) ---
    /// Voices starting further ahead than this wait on the control side and
    /// are handed to the audio thread by pollEvents() or render() once they
    /// come within range, so a long pass never floods the voice table. A
    /// host driving a device must poll more often than this.
    static constexpr double kVoiceLookaheadSeconds = 1.0;

    /// Play `clip` from engine time `startTime` (seconds). Returns the voice
    /// id, or -1 if the voice could not be queued.
    int startVoice(ClipPtr clip, double startTime, VoiceRoute route);
    /// Stopping a voice that already ended is a no-op.
    void stopVoice(int voiceId);
    void stopAllVoices();
    /// Voices playing or waiting to start.
    int getActiveVoiceCount() const;

    // --- Sinks (control thread) ---
    void setMonitorGain(float gain);
    float getMonitorGain() const;
    /// Route the mix bus to `recorder` (nullptr detaches).
    void setCaptureSink(StreamRecorder* recorder);

    // --- Clock (any thread) ---
    double getCurrentTime() const;
    int64_t getCurrentSample() const;

    // --- Completions (control thread, single consumer) ---
    int pollEvents(std::vector<EngineEvent>& events);

    // --- Audio processing (audio thread) ---
    void processBlock(float* const* outputChannels, int numChannels, int numSamples);

    // --- Offline rendering / testing ---
    void render(juce::AudioBuffer<float>& output);
    void render(int numSamples);

private:
    static constexpr int kMaxVoices = 128;

    mutable std::mutex controlMutex_;

    double sampleRate_;
    int blockSize_;

    CommandQueue commandQueue_;
    juce::AudioFormatManager formatManager_;

    // --- Control-side state ---
    int nextVoiceId_ = 1;
    double mediaDurationSeconds_ = 0.0;
    bool suppressionAvailable_ = false;
    std::vector<Voice*> pendingVoices_;             // ascending start sample
    std::vector<EngineEvent> cancelledEvents_;      // pending voices stopped before dispatch

    // --- Audio-side state ---
    MediaTransport transport_;
    SuppressionNetwork suppression_;
    std::array<Voice*, kMaxVoices> voices_{};
    int numVoices_ = 0;
    StreamRecorder* captureSink_ = nullptr;
    int64_t clockSamples_ = 0;

    juce::AudioBuffer<float> programScratch_;
    juce::AudioBuffer<float> mixBus_;
    juce::AudioBuffer<float> previewBus_;

    // --- Published to the control thread ---
    std::atomic<float> monitorGain_{1.0f};
    std::atomic<int64_t> publishedClock_{0};
    std::atomic<int64_t> publishedPosition_{0};
    std::atomic<int> publishedState_{static_cast<int>(TransportState::stopped)};
    std::atomic<int> publishedVoiceCount_{0};

    void installMedia(ProgramMedia* media);
    void sendOrWarn(const Command& cmd);
    void collectGarbage();
    void dispatchDueVoices(int64_t horizonSamples);
    void handleCommand(const Command& cmd);
    void processChunk(float* const* outputChannels, int numChannels, int offset, int numSamples);
    void retireVoice(int index);
};

} // namespace redub
