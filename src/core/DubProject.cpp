#include "core/DubProject.h"
#include "core/Logger.h"

#include <algorithm>

namespace redub {

const VoiceInfo kVoiceCatalogue[] = {
    {"Kore",   "Female"},
    {"Puck",   "Male"},
    {"Fenrir", "Male"},
    {"Charon", "Male"},
    {"Zephyr", "Female"},
};
const int kNumVoices = static_cast<int>(sizeof(kVoiceCatalogue) / sizeof(kVoiceCatalogue[0]));

static int voiceIndex(const std::string& voiceId)
{
    for (int i = 0; i < kNumVoices; ++i)
    {
        if (voiceId == kVoiceCatalogue[i].id)
            return i;
    }
    return -1;
}

DubProject::DubProject(SegmentStore& store)
    : store_(store), defaultVoice_(kVoiceCatalogue[0].id)
{
}

// ═══════════════════════════════════════════════════════════════════
// Analysis
// ═══════════════════════════════════════════════════════════════════

void DubProject::setAnalysisRequest(const AnalysisRequest& request)
{
    request_ = request;
}

const AnalysisRequest& DubProject::getAnalysisRequest() const
{
    return request_;
}

bool DubProject::analyze(AnalysisService& service, const juce::MemoryBlock& video,
                         const std::string& mimeType, std::string& error)
{
    RD_INFO("DubProject::analyze: %d bytes (%s), %s -> %s, dialect='%s', style=%s",
            static_cast<int>(video.getSize()), mimeType.c_str(),
            request_.sourceLanguage.c_str(), request_.targetLanguage.c_str(),
            request_.dialect.c_str(), request_.style.c_str());

    std::vector<AnalyzedSegment> analyzed;
    if (!service.analyze(video, mimeType, request_, analyzed, error))
    {
        RD_WARN("DubProject::analyze: analysis failed: %s", error.c_str());
        return false;
    }

    loadSegments(analyzed);
    return true;
}

int DubProject::loadSegments(const std::vector<AnalyzedSegment>& analyzed)
{
    store_.clear();
    segments_.clear();
    ++generation_;

    int index = 0;
    for (const auto& a : analyzed)
    {
        if (!(a.endTime > a.startTime))
        {
            RD_WARN("DubProject::loadSegments: dropping segment %d with start=%.3f end=%.3f",
                    index, a.startTime, a.endTime);
            ++index;
            continue;
        }

        DubSegment seg;
        seg.id = "seg-" + std::to_string(index) + "-" + std::to_string(generation_);
        seg.startTime = a.startTime;
        seg.endTime = a.endTime;
        seg.originalText = a.originalText;
        seg.translatedText = a.translatedText;
        seg.speakerLabel = a.speakerLabel;
        segments_.push_back(std::move(seg));
        ++index;
    }

    assignVoices();
    RD_INFO("DubProject::loadSegments: %d segments, %d speakers",
            static_cast<int>(segments_.size()), static_cast<int>(speakers_.size()));
    return static_cast<int>(segments_.size());
}

// ═══════════════════════════════════════════════════════════════════
// Segments
// ═══════════════════════════════════════════════════════════════════

const std::vector<DubSegment>& DubProject::getSegments() const
{
    return segments_;
}

const DubSegment* DubProject::findSegment(const std::string& id) const
{
    auto it = std::find_if(segments_.begin(), segments_.end(),
                           [&id](const DubSegment& s) { return s.id == id; });
    return it == segments_.end() ? nullptr : &*it;
}

DubSegment* DubProject::findMutable(const std::string& id)
{
    return const_cast<DubSegment*>(findSegment(id));
}

int DubProject::getNumSegments() const
{
    return static_cast<int>(segments_.size());
}

bool DubProject::isSynthesized(const std::string& id) const
{
    return store_.has(id);
}

bool DubProject::editTranslation(const std::string& id, const std::string& text)
{
    DubSegment* seg = findMutable(id);
    if (!seg)
    {
        RD_DEBUG("DubProject::editTranslation: unknown id=%s", id.c_str());
        return false;
    }
    if (seg->synthesizing)
    {
        RD_WARN("DubProject::editTranslation: id=%s is being synthesized, edit refused",
                id.c_str());
        return false;
    }

    if (seg->translatedText == text)
        return true;

    seg->translatedText = text;
    if (store_.remove(id))
        RD_INFO("DubProject::editTranslation: id=%s edited, synthesized audio dropped", id.c_str());
    return true;
}

bool DubProject::setSynthesizing(const std::string& id, bool synthesizing)
{
    DubSegment* seg = findMutable(id);
    if (!seg)
        return false;
    seg->synthesizing = synthesizing;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Voices
// ═══════════════════════════════════════════════════════════════════

void DubProject::setDefaultVoice(const std::string& voiceId)
{
    defaultVoice_ = voiceId;
}

const std::string& DubProject::getDefaultVoice() const
{
    return defaultVoice_;
}

std::vector<std::string> DubProject::getSpeakers() const
{
    return speakers_;
}

bool DubProject::setSpeakerVoice(const std::string& speakerLabel, const std::string& voiceId)
{
    if (std::find(speakers_.begin(), speakers_.end(), speakerLabel) == speakers_.end())
    {
        RD_DEBUG("DubProject::setSpeakerVoice: unknown speaker '%s'", speakerLabel.c_str());
        return false;
    }
    speakerVoices_[speakerLabel] = voiceId;
    return true;
}

std::string DubProject::getVoiceFor(const std::string& speakerLabel) const
{
    auto it = speakerVoices_.find(speakerLabel);
    if (it == speakerVoices_.end() || it->second.empty())
        return defaultVoice_;
    return it->second;
}

// The first speaker gets the default voice; each later speaker takes the
// next catalogue voice after it, wrapping around.
void DubProject::assignVoices()
{
    speakers_.clear();
    speakerVoices_.clear();

    for (const auto& seg : segments_)
    {
        if (std::find(speakers_.begin(), speakers_.end(), seg.speakerLabel) == speakers_.end())
            speakers_.push_back(seg.speakerLabel);
    }

    const int base = std::max(0, voiceIndex(defaultVoice_));
    for (size_t i = 0; i < speakers_.size(); ++i)
    {
        if (i == 0)
            speakerVoices_[speakers_[i]] = defaultVoice_;
        else
            speakerVoices_[speakers_[i]] = kVoiceCatalogue[(base + static_cast<int>(i)) % kNumVoices].id;

        RD_DEBUG("DubProject::assignVoices: %s -> %s",
                 speakers_[i].c_str(), speakerVoices_[speakers_[i]].c_str());
    }
}

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

void DubProject::reset()
{
    RD_INFO("DubProject::reset: dropping %d segments", static_cast<int>(segments_.size()));
    segments_.clear();
    speakers_.clear();
    speakerVoices_.clear();
    store_.clear();
}

SegmentStore& DubProject::getStore()
{
    return store_;
}

const SegmentStore& DubProject::getStore() const
{
    return store_;
}

std::string DubProject::makeExportFileName(int64_t millis) const
{
    return "dubbed_" + request_.targetLanguageCode + "_" + std::to_string(millis) + ".webm";
}

} // namespace redub
