#include "core/PlaybackSet.h"
#include "core/Logger.h"

namespace redub {

PlaybackSet::PlaybackSet(AudioEngine& engine)
    : engine_(engine)
{
}

void PlaybackSet::add(const std::string& handle, int voiceId)
{
    auto it = voices_.find(handle);
    if (it != voices_.end())
    {
        RD_DEBUG("PlaybackSet::add: replacing voice %d for handle=%s", it->second, handle.c_str());
        engine_.stopVoice(it->second);
        it->second = voiceId;
        return;
    }
    voices_.emplace(handle, voiceId);
}

bool PlaybackSet::contains(const std::string& handle) const
{
    return voices_.count(handle) > 0;
}

int PlaybackSet::getVoiceId(const std::string& handle) const
{
    auto it = voices_.find(handle);
    return it == voices_.end() ? -1 : it->second;
}

int PlaybackSet::size() const { return static_cast<int>(voices_.size()); }
bool PlaybackSet::empty() const { return voices_.empty(); }

void PlaybackSet::stopAll()
{
    if (voices_.empty())
        return;

    RD_DEBUG("PlaybackSet::stopAll: stopping %d voices", static_cast<int>(voices_.size()));
    for (const auto& [handle, voiceId] : voices_)
        engine_.stopVoice(voiceId);
    voices_.clear();
}

bool PlaybackSet::handleVoiceEnded(int voiceId)
{
    for (auto it = voices_.begin(); it != voices_.end(); ++it)
    {
        if (it->second == voiceId)
        {
            RD_TRACE("PlaybackSet: %s ended (voice %d)", it->first.c_str(), voiceId);
            voices_.erase(it);
            return true;
        }
    }
    return false;
}

} // namespace redub
