#pragma once

#include "core/AudioEngine.h"

#include <map>
#include <string>

namespace redub {

/// In-flight voices keyed by playback handle (a segment id, or the
/// reserved preview handle). Control thread only.
class PlaybackSet {
public:
    static constexpr const char* kPreviewHandle = "preview-tts";

    explicit PlaybackSet(AudioEngine& engine);

    PlaybackSet(const PlaybackSet&) = delete;
    PlaybackSet& operator=(const PlaybackSet&) = delete;

    /// Track `voiceId` under `handle`. A voice already held under the same
    /// handle is stopped first, so a handle never owns two instances.
    void add(const std::string& handle, int voiceId);

    bool contains(const std::string& handle) const;
    int getVoiceId(const std::string& handle) const;
    int size() const;
    bool empty() const;

    /// Stop every tracked voice and forget them. Voices that already ended
    /// are ignored by the engine.
    void stopAll();

    /// Drop the entry whose voice just finished. Returns false for voices
    /// the set does not track (already stopped, or never added).
    bool handleVoiceEnded(int voiceId);

private:
    AudioEngine& engine_;
    std::map<std::string, int> voices_;
};

} // namespace redub
