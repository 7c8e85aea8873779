#pragma once

#include "core/DubSegment.h"
#include "core/SegmentStore.h"
#include "core/Services.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace redub {

struct VoiceInfo {
    const char* id;
    const char* gender;
};

/// Prebuilt voices offered by the synthesis service, in rotation order.
extern const VoiceInfo kVoiceCatalogue[];
extern const int kNumVoices;

/// Segments, speaker voices and analysis settings of the open video. The
/// synthesized audio is held by the SegmentStore the project is bound to.
class DubProject {
public:
    explicit DubProject(SegmentStore& store);

    DubProject(const DubProject&) = delete;
    DubProject& operator=(const DubProject&) = delete;

    // --- Analysis ---
    void setAnalysisRequest(const AnalysisRequest& request);
    const AnalysisRequest& getAnalysisRequest() const;

    /// Run the analysis collaborator and load its result. On failure the
    /// current segments are kept.
    bool analyze(AnalysisService& service, const juce::MemoryBlock& video,
                 const std::string& mimeType, std::string& error);

    /// Replace all segments (and any synthesized audio) with `analyzed`.
    /// Entries whose end does not follow their start are dropped.
    int loadSegments(const std::vector<AnalyzedSegment>& analyzed);

    // --- Segments ---
    const std::vector<DubSegment>& getSegments() const;
    const DubSegment* findSegment(const std::string& id) const;
    int getNumSegments() const;
    bool isSynthesized(const std::string& id) const;

    /// Change a segment's translation. Any synthesized audio for it no
    /// longer matches and is dropped. Refused while synthesis is running.
    bool editTranslation(const std::string& id, const std::string& text);
    bool setSynthesizing(const std::string& id, bool synthesizing);

    // --- Voices ---
    void setDefaultVoice(const std::string& voiceId);
    const std::string& getDefaultVoice() const;
    std::vector<std::string> getSpeakers() const;
    bool setSpeakerVoice(const std::string& speakerLabel, const std::string& voiceId);
    std::string getVoiceFor(const std::string& speakerLabel) const;

    // --- Lifecycle ---
    void reset();
    SegmentStore& getStore();
    const SegmentStore& getStore() const;

    /// "dubbed_<code>_<millis>.webm"
    std::string makeExportFileName(int64_t millis) const;

private:
    DubSegment* findMutable(const std::string& id);
    void assignVoices();

    SegmentStore& store_;
    AnalysisRequest request_;
    std::vector<DubSegment> segments_;
    std::vector<std::string> speakers_;             // first-appearance order
    std::map<std::string, std::string> speakerVoices_;
    std::string defaultVoice_;
    int generation_ = 0;
};

} // namespace redub
