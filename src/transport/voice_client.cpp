#include "transport/voice_client.hpp"
#include "core/message_protocol.hpp"
#include "transport/url.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <thread>

namespace voicestream {
namespace transport {

namespace {

const char* const kRealtimePath = "/v3/voice/realtime";
constexpr long kRetryAfterMaxSeconds = 60;

bool isRetryableStatus(int status) {
    return status == 429 || status >= 500;
}

std::string serverMessage(const HttpResponse& response) {
    utils::JsonValue body;
    if (utils::JsonParser::tryParse(response.body, body) && body.isObject()) {
        return body.getString("message");
    }
    return "";
}

} // namespace

VoiceClient::VoiceClient(VoiceClientOptions options,
                         std::shared_ptr<HttpTransport> http,
                         std::shared_ptr<ConnectionFactory> connections)
    : options_(std::move(options)),
      http_(std::move(http)),
      connections_(std::move(connections)) {
    if (options_.apiKey.empty()) {
        throw utils::AuthException("API key is required");
    }
    if (!http_ || !connections_) {
        throw utils::ConfigException("VoiceClient requires HTTP and WebSocket transports");
    }
}

std::shared_ptr<VoiceClient> VoiceClient::create(const VoiceClientOptions& options) {
    auto timeout = std::chrono::milliseconds(options.timeoutMs);
    return std::make_shared<VoiceClient>(options,
                                         std::make_shared<BeastHttpClient>(options.baseUrl, timeout),
                                         std::make_shared<BeastConnectionFactory>(timeout));
}

SessionDescriptor VoiceClient::createSession(const SessionRequest& request) {
    HttpRequest httpRequest = authorizedRequest("POST", kRealtimePath);
    httpRequest.headers["Content-Type"] = "application/json";
    httpRequest.body = buildSessionBody(request);

    HttpResponse response = sendWithRetry(httpRequest, "Voice session creation");

    SessionDescriptor descriptor = parseSessionResponse(response, true);
    utils::Logger::info("Voice session created: " + descriptor.sessionId);
    return descriptor;
}

SessionDescriptor VoiceClient::reconnectSession(const std::string& token) {
    HttpRequest httpRequest = authorizedRequest("GET",
        std::string(kRealtimePath) + "?token=" + urlEncode(token));

    HttpResponse response = sendWithRetry(httpRequest, "Voice session reconnection");
    return parseSessionResponse(response, false);
}

std::shared_ptr<StreamConnection> VoiceClient::openConnection(const std::string& streamingUrl,
                                                              const std::string& token,
                                                              ConnectionHandlers handlers) {
    validateStreamingUrl(streamingUrl);

    std::string url = streamingUrl;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "token=" + urlEncode(token);

    auto shared = std::make_shared<ConnectionHandlers>(std::move(handlers));

    ConnectionEvents events;
    events.onOpen = [shared]() {
        if (shared->onOpen) {
            shared->onOpen();
        }
    };
    events.onText = [shared](const std::string& frame) {
        dispatchFrame(frame, *shared);
    };
    events.onError = [shared](const std::string& message) {
        if (shared->onConnectionError) {
            shared->onConnectionError(message);
        }
    };
    events.onClose = [shared](int code, const std::string& reason) {
        if (shared->onClose) {
            shared->onClose(code, reason);
        }
    };

    return connections_->connect(url, std::move(events));
}

bool VoiceClient::sendAudioChunk(StreamConnection& connection, const uint8_t* data, size_t size) {
    if (connection.isOpen()) {
        connection.sendText(core::MessageProtocol::serializeAudioChunk(data, size));
    }
    return hasSendCapacity(connection);
}

bool VoiceClient::sendAudioChunk(StreamConnection& connection, const std::vector<uint8_t>& data) {
    return sendAudioChunk(connection, data.data(), data.size());
}

void VoiceClient::sendEndOfSource(StreamConnection& connection) {
    if (!connection.isOpen()) {
        return;
    }
    connection.sendText(core::MessageProtocol::serializeEndOfSource());
}

bool VoiceClient::hasSendCapacity(const StreamConnection& connection) const {
    return connection.bufferedAmount() < options_.highWaterMarkBytes;
}

void VoiceClient::dispatchFrame(const std::string& frame, const ConnectionHandlers& handlers) {
    auto message = core::MessageProtocol::parseServerMessage(frame);
    if (!message) {
        return;
    }

    switch (message->type) {
        case core::ServerMessageType::SOURCE_TRANSCRIPT_UPDATE:
            if (handlers.onSourceTranscript) handlers.onSourceTranscript(message->update);
            break;
        case core::ServerMessageType::TARGET_TRANSCRIPT_UPDATE:
            if (handlers.onTargetTranscript) handlers.onTargetTranscript(message->update);
            break;
        case core::ServerMessageType::END_OF_SOURCE_TRANSCRIPT:
            if (handlers.onEndOfSourceTranscript) handlers.onEndOfSourceTranscript();
            break;
        case core::ServerMessageType::END_OF_TARGET_TRANSCRIPT:
            if (handlers.onEndOfTargetTranscript) handlers.onEndOfTargetTranscript(message->language);
            break;
        case core::ServerMessageType::END_OF_STREAM:
            if (handlers.onEndOfStream) handlers.onEndOfStream();
            break;
        case core::ServerMessageType::ERROR:
            if (handlers.onError) handlers.onError(message->error);
            break;
        case core::ServerMessageType::UNKNOWN:
            break;
    }
}

void VoiceClient::mapHttpError(const HttpResponse& response, const std::string& operation) {
    const int status = response.status;
    const std::string message = serverMessage(response);

    switch (status) {
        case 400:
            throw utils::ValidationException("Voice session creation failed: " +
                                             (message.empty() ? std::string("Bad request") : message));
        case 401:
            throw utils::AuthException("Authentication failed: Invalid API key");
        case 403:
            throw utils::AccessDeniedException(
                "Voice API access denied. Your plan may not include Voice API access.");
        case 429:
            throw utils::RateLimitException("Rate limit exceeded: Too many requests");
        case 456:
            throw utils::QuotaException("Quota exceeded: Character limit reached");
        default:
            break;
    }

    if (status >= 500) {
        if (status == 503) {
            throw utils::NetworkException("Service temporarily unavailable: Please try again later");
        }
        throw utils::NetworkException("Server error (" + std::to_string(status) + ")", message);
    }
    throw utils::VoiceException(operation + " failed with HTTP status " + std::to_string(status) +
                                (message.empty() ? "" : ": " + message));
}

std::chrono::milliseconds VoiceClient::backoffDelay(int attempt) const {
    auto delay = options_.retryInitialDelay;
    for (int i = 0; i < attempt && delay < options_.retryMaxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.retryMaxDelay);
}

bool VoiceClient::parseRetryAfter(const std::string& value, std::chrono::milliseconds& delay) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    const long seconds = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        return false;
    }
    delay = std::chrono::seconds(std::max(0L, std::min(seconds, kRetryAfterMaxSeconds)));
    return true;
}

HttpResponse VoiceClient::sendWithRetry(const HttpRequest& request, const std::string& operation) {
    for (int attempt = 0;; ++attempt) {
        const bool canRetry = attempt < options_.maxRetries;
        std::chrono::milliseconds delay = backoffDelay(attempt);
        std::string failure;

        HttpResponse response;
        bool received = true;
        try {
            response = http_->send(request);
        } catch (const utils::NetworkException& e) {
            if (!canRetry) {
                throw;
            }
            received = false;
            failure = e.what();
        }

        if (received) {
            if (response.ok()) {
                return response;
            }
            if (!canRetry || !isRetryableStatus(response.status)) {
                mapHttpError(response, operation);
            }
            auto header = response.headers.find("retry-after");
            std::chrono::milliseconds retryAfter{0};
            if (response.status == 429 && header != response.headers.end() &&
                parseRetryAfter(header->second, retryAfter)) {
                delay = retryAfter;
            }
            failure = "HTTP " + std::to_string(response.status);
        }

        utils::Logger::warn(operation + " failed (" + failure + "), retrying in " +
                            std::to_string(delay.count()) + "ms (attempt " +
                            std::to_string(attempt + 1) + "/" + std::to_string(options_.maxRetries) + ")");
        std::this_thread::sleep_for(delay);
    }
}

void VoiceClient::validateStreamingUrl(const std::string& streamingUrl) const {
    ParsedUrl parsed;
    if (!parseUrl(streamingUrl, parsed)) {
        throw utils::VoiceException("Invalid streaming URL: unable to parse URL");
    }
    if (parsed.scheme != "wss") {
        throw utils::VoiceException("Invalid streaming URL: scheme must be wss://");
    }
    if (!hostMatchesDomain(parsed.host, options_.allowedDomain)) {
        throw utils::VoiceException("Invalid streaming URL: hostname must be under " +
                                    options_.allowedDomain);
    }
}

HttpRequest VoiceClient::authorizedRequest(const std::string& method, const std::string& target) const {
    HttpRequest request;
    request.method = method;
    request.target = target;
    request.headers["Authorization"] = "DeepL-Auth-Key " + options_.apiKey;
    return request;
}

SessionDescriptor VoiceClient::parseSessionResponse(const HttpResponse& response, bool requireSessionId) {
    utils::JsonValue body;
    if (!utils::JsonParser::tryParse(response.body, body) || !body.isObject()) {
        throw utils::VoiceException("Invalid voice session response: body is not a JSON object");
    }

    SessionDescriptor descriptor;
    descriptor.streamingUrl = body.getString("streaming_url");
    descriptor.token = body.getString("token");
    descriptor.sessionId = body.getString("session_id");

    if (descriptor.streamingUrl.empty() || descriptor.token.empty()) {
        throw utils::VoiceException("Invalid voice session response: missing streaming_url or token");
    }
    if (requireSessionId && descriptor.sessionId.empty()) {
        throw utils::VoiceException("Invalid voice session response: missing session_id");
    }
    return descriptor;
}

std::string VoiceClient::buildSessionBody(const SessionRequest& request) {
    utils::JsonValue targets = utils::JsonValue::array();
    for (const auto& language : request.targetLanguages) {
        targets.addArrayElement(utils::JsonValue(language));
    }

    utils::JsonValue body = utils::JsonValue::object();
    body.setObjectProperty("target_languages", targets);
    body.setObjectProperty("source_media_content_type", utils::JsonValue(request.sourceMediaContentType));

    if (!request.sourceLanguage.empty()) {
        body.setObjectProperty("source_language", utils::JsonValue(request.sourceLanguage));
    }
    if (!request.sourceLanguageMode.empty()) {
        body.setObjectProperty("source_language_mode", utils::JsonValue(request.sourceLanguageMode));
    }
    if (!request.formality.empty()) {
        body.setObjectProperty("formality", utils::JsonValue(request.formality));
    }
    if (!request.glossaryId.empty()) {
        body.setObjectProperty("glossary_id", utils::JsonValue(request.glossaryId));
    }
    return utils::JsonParser::stringify(body);
}

} // namespace transport
} // namespace voicestream
