#pragma once

#include "core/ClipBuffer.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace redub {

/// One decoded, trimmed clip per dub segment id.
///
/// Writes may come from several synthesis completions at once; each put is
/// atomic with respect to the others, so the clip left behind for an id is
/// the one whose synthesis finished last.
class SegmentStore {
public:
    /// `engineSampleRate` is the rate decoded clips are converted to.
    explicit SegmentStore(double engineSampleRate);
    ~SegmentStore();

    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    // --- Storage ---
    /// Replaces any clip held for `segmentId`. A null clip is rejected.
    bool put(const std::string& segmentId, ClipPtr clip);
    ClipPtr get(const std::string& segmentId) const;
    bool has(const std::string& segmentId) const;
    bool remove(const std::string& segmentId);
    void clear();
    int size() const;
    std::vector<std::string> getIds() const;

    // --- Decoding ---
    /// Decode any basic container (WAV, AIFF, FLAC, Ogg) into a clip at the
    /// engine rate. Returns nullptr with `error` set on failure.
    ClipPtr decode(const juce::MemoryBlock& encoded, const std::string& name,
                   std::string& error) const;

    /// decode() + BufferTrimmer::trim() + put(). On failure the existing
    /// entry for `segmentId` (if any) is left untouched.
    bool decodeAndStore(const std::string& segmentId, const juce::MemoryBlock& encoded,
                        std::string& error);

    double getSampleRate() const { return sampleRate_; }

private:
    double sampleRate_;
    juce::AudioFormatManager formatManager_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ClipPtr> clips_;
};

} // namespace redub
