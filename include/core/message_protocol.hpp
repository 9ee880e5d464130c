#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "transport/voice_types.hpp"
#include "utils/json_utils.hpp"

namespace voicestream {
namespace core {

// Server to client message types, in dispatch priority order
enum class ServerMessageType {
    UNKNOWN,
    SOURCE_TRANSCRIPT_UPDATE,
    TARGET_TRANSCRIPT_UPDATE,
    END_OF_SOURCE_TRANSCRIPT,
    END_OF_TARGET_TRANSCRIPT,
    END_OF_STREAM,
    ERROR
};

/**
 * A parsed server frame. Only the fields belonging to `type` are set:
 * `update` for transcript updates, `language` for end of target transcript,
 * `error` for error frames.
 */
struct ServerMessage {
    ServerMessageType type = ServerMessageType::UNKNOWN;
    transport::TranscriptUpdate update;
    std::string language;
    transport::ServerError error;
};

/**
 * Wire format of the voice streaming WebSocket.
 *
 * Client frames:
 *   {"source_media_chunk":{"data":"<base64>"}}
 *   {"end_of_source_media":{}}
 *
 * Server frames carry exactly one well-known top-level key. When a frame
 * carries several, the first in ServerMessageType order wins.
 */
class MessageProtocol {
public:
    static std::string serializeAudioChunk(const uint8_t* data, size_t size);
    static std::string serializeAudioChunk(const std::vector<uint8_t>& data);
    static std::string serializeEndOfSource();

    /**
     * Parse a server frame. Returns std::nullopt for anything that is not a
     * JSON object with a known key; such frames must be ignored by callers.
     */
    static std::optional<ServerMessage> parseServerMessage(const std::string& frame);

    static ServerMessageType getMessageType(const utils::JsonValue& root);
    static std::string messageTypeToString(ServerMessageType type);

private:
    static transport::TranscriptUpdate parseTranscriptUpdate(const utils::JsonValue& body);
    static std::vector<transport::TranscriptSegment> parseSegments(const utils::JsonValue& list);
    static transport::ServerError parseError(const utils::JsonValue& body);
};

} // namespace core
} // namespace voicestream
