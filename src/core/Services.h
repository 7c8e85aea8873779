#pragma once

#include <juce_core/juce_core.h>

#include <string>
#include <vector>

namespace redub {

// Collaborators outside the audio core. Implementations talk to remote
// services and may block; they are only ever called from the control thread.

struct AnalysisRequest {
    std::string sourceLanguage = "English";
    std::string targetLanguage = "Arabic";
    std::string targetLanguageCode = "ar";
    std::string dialect;                // empty = standard variety
    std::string style = "Natural";      // Natural, Dramatic, Formal, Energetic
};

struct AnalyzedSegment {
    double startTime = 0.0;
    double endTime = 0.0;
    std::string originalText;
    std::string translatedText;
    std::string speakerLabel;
};

class AnalysisService {
public:
    virtual ~AnalysisService() = default;

    /// Transcribe, diarize and translate the video's speech. Segments come
    /// back in timeline order.
    virtual bool analyze(const juce::MemoryBlock& video, const std::string& mimeType,
                         const AnalysisRequest& request,
                         std::vector<AnalyzedSegment>& segments, std::string& error) = 0;
};

class SynthesisService {
public:
    virtual ~SynthesisService() = default;

    /// Speak `text` with `voiceId`. `pcm` receives raw 16-bit little-endian
    /// mono PCM at WavCodec::kSynthesisSampleRate, with no container.
    virtual bool synthesize(const std::string& text, const std::string& voiceId,
                            juce::MemoryBlock& pcm, std::string& error) = 0;
};

} // namespace redub
