#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "transport/voice_types.hpp"

namespace voicestream {
namespace core {

// Source language reported until the server tags a concluded segment
extern const char* const kAutoDetectLanguage;

enum class SessionState {
    CONNECTING,
    STREAMING,
    RECONNECTING,
    COMPLETED,
    FAILED
};

std::string sessionStateToString(SessionState state);

/**
 * Per-stream settings. Empty strings mean "not set"; an empty sourceLanguage
 * requests automatic detection.
 */
struct StreamOptions {
    std::vector<std::string> targetLanguages;
    std::string sourceLanguage;
    std::string sourceLanguageMode;
    std::string formality;
    std::string glossaryId;
    std::string contentType;

    size_t chunkSize = 6400;
    std::chrono::milliseconds chunkInterval{200};

    // Flow control: wait this long per round while the send buffer is above
    // the high-water mark, for at most maxFlowControlWaits rounds.
    std::chrono::milliseconds flowControlBackoff{50};
    int maxFlowControlWaits = 20;

    bool reconnect = true;
    int maxReconnectAttempts = 3;
};

struct Transcript {
    std::string language;
    std::string text;
    std::vector<transport::TranscriptSegment> segments;
    std::string detectedLanguage;
};

struct SessionResult {
    std::string sessionId;
    Transcript source;
    std::vector<Transcript> targets; // in declared target order
};

/**
 * Optional observers, invoked on the thread executing run().
 */
struct StreamCallbacks {
    std::function<void(const transport::TranscriptUpdate&)> onSourceTranscript;
    std::function<void(const transport::TranscriptUpdate&)> onTargetTranscript;
    std::function<void()> onEndOfSourceTranscript;
    std::function<void(const std::string& language)> onEndOfTargetTranscript;
    std::function<void()> onEndOfStream;
    std::function<void(const transport::ServerError&)> onError;
    std::function<void(int attempt)> onReconnecting;
};

} // namespace core
} // namespace voicestream
