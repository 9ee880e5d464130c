#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "transport/http_client.hpp"
#include "transport/stream_connection.hpp"
#include "transport/voice_types.hpp"

namespace voicestream {
namespace transport {

struct VoiceClientOptions {
    std::string apiKey;
    std::string baseUrl = "https://api.deepl.com";
    std::string allowedDomain = "deepl.com";
    size_t highWaterMarkBytes = 1024 * 1024;
    int timeoutMs = 30000;

    // REST retries for 429, 5xx and transport failures. The delay doubles
    // from retryInitialDelay up to retryMaxDelay; a 429 with a numeric
    // Retry-After waits that long instead (at most 60 s).
    int maxRetries = 3;
    std::chrono::milliseconds retryInitialDelay{1000};
    std::chrono::milliseconds retryMaxDelay{10000};
};

/**
 * Typed callbacks for one streaming connection. Invoked on the connection's
 * I/O thread; unset callbacks are skipped.
 */
struct ConnectionHandlers {
    std::function<void()> onOpen;
    std::function<void(const TranscriptUpdate&)> onSourceTranscript;
    std::function<void(const TranscriptUpdate&)> onTargetTranscript;
    std::function<void()> onEndOfSourceTranscript;
    std::function<void(const std::string& language)> onEndOfTargetTranscript;
    std::function<void()> onEndOfStream;
    std::function<void(const ServerError&)> onError;
    std::function<void(const std::string& message)> onConnectionError;
    std::function<void(int code, const std::string& reason)> onClose;
};

/**
 * Client for the voice API: session REST endpoints plus the streaming
 * WebSocket. Holds no per-session state and may be shared between sessions.
 */
class VoiceClient {
public:
    VoiceClient(VoiceClientOptions options,
                std::shared_ptr<HttpTransport> http,
                std::shared_ptr<ConnectionFactory> connections);

    /**
     * Build a client on the Boost.Beast HTTPS and WebSocket transports.
     * Throws ConfigException for an invalid base URL.
     */
    static std::shared_ptr<VoiceClient> create(const VoiceClientOptions& options);

    /**
     * POST /v3/voice/realtime. Throws the exception matching the HTTP status
     * (see mapHttpError) once retries are exhausted, or VoiceException for a
     * malformed response.
     */
    SessionDescriptor createSession(const SessionRequest& request);

    /**
     * GET /v3/voice/realtime?token=... Exchanges a reconnection token for a
     * fresh streaming URL and token. The returned sessionId may be empty.
     */
    SessionDescriptor reconnectSession(const std::string& token);

    /**
     * Validate the streaming URL, then open the WebSocket with the token
     * appended as a query parameter. Throws VoiceException when the URL is not
     * wss:// or its host is outside the allowed domain.
     */
    std::shared_ptr<StreamConnection> openConnection(const std::string& streamingUrl,
                                                     const std::string& token,
                                                     ConnectionHandlers handlers);

    /**
     * Send one audio chunk. Returns true while the connection's send buffer is
     * below the high-water mark, false when the caller should back off.
     * Nothing is sent when the connection is not open.
     */
    bool sendAudioChunk(StreamConnection& connection, const uint8_t* data, size_t size);
    bool sendAudioChunk(StreamConnection& connection, const std::vector<uint8_t>& data);

    // Signal end of audio. Ignored when the connection is not open.
    void sendEndOfSource(StreamConnection& connection);

    bool hasSendCapacity(const StreamConnection& connection) const;

    const VoiceClientOptions& getOptions() const { return options_; }

    // Route a raw frame to the matching handler; unparseable frames are dropped.
    static void dispatchFrame(const std::string& frame, const ConnectionHandlers& handlers);

    // Throws the exception mapped from a non-2xx REST response.
    [[noreturn]] static void mapHttpError(const HttpResponse& response, const std::string& operation);

    // Delay before retry number `attempt` + 1 (attempt counts from 0)
    std::chrono::milliseconds backoffDelay(int attempt) const;

    /**
     * Parse a Retry-After value given in seconds, clamped to [0, 60].
     * Returns false for a missing or non-numeric value.
     */
    static bool parseRetryAfter(const std::string& value, std::chrono::milliseconds& delay);

private:
    HttpResponse sendWithRetry(const HttpRequest& request, const std::string& operation);

    void validateStreamingUrl(const std::string& streamingUrl) const;
    HttpRequest authorizedRequest(const std::string& method, const std::string& target) const;
    static SessionDescriptor parseSessionResponse(const HttpResponse& response, bool requireSessionId);
    static std::string buildSessionBody(const SessionRequest& request);

    VoiceClientOptions options_;
    std::shared_ptr<HttpTransport> http_;
    std::shared_ptr<ConnectionFactory> connections_;
};

} // namespace transport
} // namespace voicestream
