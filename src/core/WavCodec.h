#pragma once

#include <juce_core/juce_core.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace redub {

struct PcmClip {
    int sampleRate = 0;
    int numChannels = 0;
    int bitsPerSample = 0;
    std::vector<int16_t> samples;   // interleaved
};

/// The minimal 44-byte RIFF/WAVE layout the synthesis service's raw PCM is
/// wrapped in before decoding:
///
///   0  "RIFF"   4  36 + dataSize   8  "WAVE"
///   12 "fmt "   16 16              20 1 (PCM)      22 channels
///   24 rate     28 byteRate        32 blockAlign   34 bitsPerSample
///   36 "data"   40 dataSize        44 PCM bytes
///
/// All integers little-endian.
class WavCodec {
public:
    static constexpr int kHeaderSize = 44;
    static constexpr int kBitsPerSample = 16;
    static constexpr int kSynthesisSampleRate = 24000;

    /// Wraps raw 16-bit little-endian PCM in the header above.
    static juce::MemoryBlock wrapPcm16(const void* pcm, size_t numBytes,
                                       int sampleRate = kSynthesisSampleRate,
                                       int numChannels = 1);

    /// Parses exactly the layout above. Returns false with `error` set for
    /// anything else (wrong tags, non-PCM, not 16-bit, truncated data).
    static bool parsePcm16(const juce::MemoryBlock& wav, PcmClip& out, std::string& error);
};

} // namespace redub
