#include "core/transcript_accumulator.hpp"

namespace voicestream {
namespace core {

TranscriptAccumulator::TranscriptAccumulator(std::string language)
    : language_(std::move(language)) {
}

size_t TranscriptAccumulator::addConcluded(const std::vector<transport::TranscriptSegment>& segments) {
    if (frozen_) {
        return 0;
    }

    for (const auto& segment : segments) {
        if (detectedLanguage_.empty() && !segment.language.empty()) {
            detectedLanguage_ = segment.language;
        }
        segments_.push_back(segment);
    }
    return segments.size();
}

std::string TranscriptAccumulator::fullText() const {
    std::string text;
    for (const auto& segment : segments_) {
        if (!text.empty()) {
            text += ' ';
        }
        text += segment.text;
    }
    return text;
}

const std::string& TranscriptAccumulator::language() const {
    return detectedLanguage_.empty() ? language_ : detectedLanguage_;
}

Transcript TranscriptAccumulator::toTranscript() const {
    Transcript transcript;
    transcript.language = language();
    transcript.text = fullText();
    transcript.segments = segments_;
    transcript.detectedLanguage = detectedLanguage_;
    return transcript;
}

} // namespace core
} // namespace voicestream
