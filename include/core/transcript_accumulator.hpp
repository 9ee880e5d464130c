#pragma once

#include <string>
#include <vector>
#include "core/stream_types.hpp"

namespace voicestream {
namespace core {

/**
 * Concluded segments of one language, in arrival order. Append-only until
 * freeze(); tentative segments are never stored.
 */
class TranscriptAccumulator {
public:
    explicit TranscriptAccumulator(std::string language);

    /**
     * Append concluded segments. Returns the number appended (0 once frozen).
     * The first segment carrying a language tag sets the detected language.
     */
    size_t addConcluded(const std::vector<transport::TranscriptSegment>& segments);

    void freeze() { frozen_ = true; }
    bool isFrozen() const { return frozen_; }

    // Space-joined text of all concluded segments
    std::string fullText() const;

    const std::vector<transport::TranscriptSegment>& segments() const { return segments_; }

    // Detected language if any, else the language given at construction
    const std::string& language() const;
    const std::string& requestedLanguage() const { return language_; }
    const std::string& detectedLanguage() const { return detectedLanguage_; }

    Transcript toTranscript() const;

private:
    std::string language_;
    std::string detectedLanguage_;
    std::vector<transport::TranscriptSegment> segments_;
    bool frozen_ = false;
};

} // namespace core
} // namespace voicestream
