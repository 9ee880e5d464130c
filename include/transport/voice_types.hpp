#pragma once

#include <string>
#include <vector>

namespace voicestream {
namespace transport {

/**
 * Credentials needed to open or resume a streaming connection.
 * A reconnect yields a new URL and token; sessionId stays the same.
 */
struct SessionDescriptor {
    std::string streamingUrl;
    std::string token;
    std::string sessionId;
};

/**
 * Body of POST /v3/voice/realtime. Empty optional fields are omitted.
 */
struct SessionRequest {
    std::vector<std::string> targetLanguages;
    std::string sourceMediaContentType;
    std::string sourceLanguage;
    std::string sourceLanguageMode; // "auto" | "fixed"
    std::string formality;
    std::string glossaryId;
};

struct TranscriptSegment {
    std::string text;
    std::string language; // empty when the server did not tag the segment
    double startTime = 0.0;
    double endTime = 0.0;
};

/**
 * Incremental transcript from the server. Only concluded segments are final;
 * tentative ones may still change.
 */
struct TranscriptUpdate {
    std::string language; // set for target updates
    std::vector<TranscriptSegment> concluded;
    std::vector<TranscriptSegment> tentative;
};

struct ServerError {
    std::string requestType;
    int errorCode = 0;
    int reasonCode = 0;
    std::string message;
};

} // namespace transport
} // namespace voicestream
