#include "core/WavCodec.h"
#include "core/Logger.h"

#include <cstring>

namespace redub {

static bool readTag(juce::InputStream& in, const char* expected)
{
    char tag[4];
    if (in.read(tag, 4) != 4)
        return false;
    return std::memcmp(tag, expected, 4) == 0;
}

juce::MemoryBlock WavCodec::wrapPcm16(const void* pcm, size_t numBytes,
                                      int sampleRate, int numChannels)
{
    const int blockAlign = numChannels * kBitsPerSample / 8;
    const int byteRate = sampleRate * blockAlign;
    const auto dataSize = static_cast<int>(numBytes);

    juce::MemoryBlock wav;
    juce::MemoryOutputStream out(wav, false);
    out.preallocate(static_cast<size_t>(kHeaderSize) + numBytes);

    out.write("RIFF", 4);
    out.writeInt(36 + dataSize);
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    out.writeInt(16);
    out.writeShort(1);
    out.writeShort(static_cast<short>(numChannels));
    out.writeInt(sampleRate);
    out.writeInt(byteRate);
    out.writeShort(static_cast<short>(blockAlign));
    out.writeShort(static_cast<short>(kBitsPerSample));

    out.write("data", 4);
    out.writeInt(dataSize);
    if (numBytes > 0)
        out.write(pcm, numBytes);
    out.flush();

    RD_TRACE("WavCodec::wrapPcm16: %d data bytes, sr=%d, ch=%d", dataSize, sampleRate, numChannels);
    return wav;
}

bool WavCodec::parsePcm16(const juce::MemoryBlock& wav, PcmClip& out, std::string& error)
{
    if (wav.getSize() < static_cast<size_t>(kHeaderSize))
    {
        error = "WAV data shorter than the 44-byte header";
        return false;
    }

    juce::MemoryInputStream in(wav, false);

    if (!readTag(in, "RIFF"))
    {
        error = "Missing RIFF tag";
        return false;
    }
    const int riffSize = in.readInt();
    if (!readTag(in, "WAVE") || !readTag(in, "fmt "))
    {
        error = "Missing WAVE/fmt tags";
        return false;
    }
    const int fmtSize = in.readInt();
    const int format = in.readShort();
    const int channels = in.readShort();
    const int sampleRate = in.readInt();
    const int byteRate = in.readInt();
    const int blockAlign = in.readShort();
    const int bits = in.readShort();

    if (fmtSize != 16 || format != 1)
    {
        error = "Not an uncompressed PCM fmt chunk";
        return false;
    }
    if (bits != kBitsPerSample || channels < 1 || sampleRate <= 0)
    {
        error = "Unsupported PCM layout (bits=" + std::to_string(bits)
              + ", ch=" + std::to_string(channels) + ")";
        return false;
    }
    if (blockAlign != channels * bits / 8 || byteRate != sampleRate * blockAlign)
    {
        error = "Inconsistent byte rate / block align";
        return false;
    }
    if (!readTag(in, "data"))
    {
        error = "Missing data tag";
        return false;
    }
    const int dataSize = in.readInt();
    const auto payload = static_cast<int64_t>(wav.getSize()) - kHeaderSize;
    if (dataSize < 0 || dataSize > payload
        || static_cast<int64_t>(riffSize) != int64_t(36) + dataSize)
    {
        error = "Declared data size does not match the payload";
        return false;
    }

    out.sampleRate = sampleRate;
    out.numChannels = channels;
    out.bitsPerSample = bits;
    out.samples.resize(static_cast<size_t>(dataSize / 2));
    for (auto& sample : out.samples)
        sample = in.readShort();

    return true;
}

} // namespace redub
