#include "core/SegmentSynthesizer.h"
#include "core/Logger.h"
#include "core/WavCodec.h"

namespace redub {

SegmentSynthesizer::SegmentSynthesizer(DubProject& project, SynthesisService& service)
    : project_(project), service_(service)
{
}

bool SegmentSynthesizer::synthesize(const std::string& segmentId, std::string& error)
{
    const DubSegment* seg = project_.findSegment(segmentId);
    if (!seg)
    {
        error = "Unknown segment: " + segmentId;
        RD_WARN("SegmentSynthesizer::synthesize: %s", error.c_str());
        return false;
    }

    const std::string text = seg->translatedText;
    const std::string voice = project_.getVoiceFor(seg->speakerLabel);
    project_.setSynthesizing(segmentId, true);

    RD_INFO("SegmentSynthesizer::synthesize: id=%s voice=%s chars=%d",
            segmentId.c_str(), voice.c_str(), static_cast<int>(text.size()));

    juce::MemoryBlock pcm;
    bool ok = service_.synthesize(text, voice, pcm, error);
    if (!ok)
    {
        RD_WARN("SegmentSynthesizer::synthesize: id=%s synthesis failed: %s",
                segmentId.c_str(), error.c_str());
    }
    else
    {
        auto wav = WavCodec::wrapPcm16(pcm.getData(), pcm.getSize());
        ok = project_.getStore().decodeAndStore(segmentId, wav, error);
        if (!ok)
            RD_WARN("SegmentSynthesizer::synthesize: id=%s decode failed: %s",
                    segmentId.c_str(), error.c_str());
    }

    project_.setSynthesizing(segmentId, false);
    return ok;
}

int SegmentSynthesizer::synthesizeMissing()
{
    std::vector<std::string> missing;
    for (const auto& seg : project_.getSegments())
    {
        if (!project_.isSynthesized(seg.id))
            missing.push_back(seg.id);
    }

    int failed = 0;
    for (const auto& id : missing)
    {
        std::string error;
        if (!synthesize(id, error))
            ++failed;
    }

    if (!missing.empty())
        RD_INFO("SegmentSynthesizer::synthesizeMissing: %d requested, %d left without audio",
                static_cast<int>(missing.size()), failed);
    return failed;
}

} // namespace redub
