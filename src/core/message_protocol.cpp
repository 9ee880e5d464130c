#include "core/message_protocol.hpp"
#include "utils/base64.hpp"
#include "utils/logging.hpp"

namespace voicestream {
namespace core {

namespace {

struct KeyMapping {
    const char* key;
    ServerMessageType type;
};

// Dispatch priority order
const KeyMapping kServerKeys[] = {
    {"source_transcript_update", ServerMessageType::SOURCE_TRANSCRIPT_UPDATE},
    {"target_transcript_update", ServerMessageType::TARGET_TRANSCRIPT_UPDATE},
    {"end_of_source_transcript", ServerMessageType::END_OF_SOURCE_TRANSCRIPT},
    {"end_of_target_transcript", ServerMessageType::END_OF_TARGET_TRANSCRIPT},
    {"end_of_stream", ServerMessageType::END_OF_STREAM},
    {"error", ServerMessageType::ERROR},
};

} // namespace

std::string MessageProtocol::serializeAudioChunk(const uint8_t* data, size_t size) {
    utils::JsonValue chunk = utils::JsonValue::object();
    chunk.setObjectProperty("data", utils::JsonValue(utils::encodeBase64(data, size)));

    utils::JsonValue root = utils::JsonValue::object();
    root.setObjectProperty("source_media_chunk", chunk);
    return utils::JsonParser::stringify(root);
}

std::string MessageProtocol::serializeAudioChunk(const std::vector<uint8_t>& data) {
    return serializeAudioChunk(data.data(), data.size());
}

std::string MessageProtocol::serializeEndOfSource() {
    utils::JsonValue root = utils::JsonValue::object();
    root.setObjectProperty("end_of_source_media", utils::JsonValue::object());
    return utils::JsonParser::stringify(root);
}

std::optional<ServerMessage> MessageProtocol::parseServerMessage(const std::string& frame) {
    utils::JsonValue root;
    if (!utils::JsonParser::tryParse(frame, root)) {
        utils::Logger::debug("Discarding unparseable frame (" + std::to_string(frame.size()) + " bytes)");
        return std::nullopt;
    }
    if (!root.isObject()) {
        utils::Logger::debug("Discarding non-object frame");
        return std::nullopt;
    }

    ServerMessage message;
    message.type = getMessageType(root);

    switch (message.type) {
        case ServerMessageType::SOURCE_TRANSCRIPT_UPDATE:
            message.update = parseTranscriptUpdate(root.getProperty("source_transcript_update"));
            break;
        case ServerMessageType::TARGET_TRANSCRIPT_UPDATE:
            message.update = parseTranscriptUpdate(root.getProperty("target_transcript_update"));
            message.language = message.update.language;
            break;
        case ServerMessageType::END_OF_SOURCE_TRANSCRIPT:
        case ServerMessageType::END_OF_STREAM:
            break;
        case ServerMessageType::END_OF_TARGET_TRANSCRIPT:
            message.language = root.getProperty("end_of_target_transcript").getString("language");
            break;
        case ServerMessageType::ERROR:
            message.error = parseError(root.getProperty("error"));
            break;
        case ServerMessageType::UNKNOWN:
            utils::Logger::debug("Discarding frame without a known message key");
            return std::nullopt;
    }

    return message;
}

ServerMessageType MessageProtocol::getMessageType(const utils::JsonValue& root) {
    if (!root.isObject()) {
        return ServerMessageType::UNKNOWN;
    }
    for (const auto& mapping : kServerKeys) {
        if (root.hasProperty(mapping.key)) {
            return mapping.type;
        }
    }
    return ServerMessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(ServerMessageType type) {
    for (const auto& mapping : kServerKeys) {
        if (mapping.type == type) {
            return mapping.key;
        }
    }
    return "unknown";
}

transport::TranscriptUpdate MessageProtocol::parseTranscriptUpdate(const utils::JsonValue& body) {
    transport::TranscriptUpdate update;
    if (!body.isObject()) {
        return update;
    }
    update.language = body.getString("language");
    update.concluded = parseSegments(body.getProperty("concluded"));
    update.tentative = parseSegments(body.getProperty("tentative"));
    return update;
}

std::vector<transport::TranscriptSegment> MessageProtocol::parseSegments(const utils::JsonValue& list) {
    std::vector<transport::TranscriptSegment> segments;
    if (!list.isArray()) {
        return segments;
    }

    segments.reserve(list.asArray().size());
    for (const auto& item : list.asArray()) {
        if (!item.isObject()) {
            continue;
        }
        transport::TranscriptSegment segment;
        segment.text = item.getString("text");
        segment.language = item.getString("language");
        segment.startTime = item.getNumber("start_time");
        segment.endTime = item.getNumber("end_time");
        segments.push_back(std::move(segment));
    }
    return segments;
}

transport::ServerError MessageProtocol::parseError(const utils::JsonValue& body) {
    transport::ServerError error;
    if (!body.isObject()) {
        error.message = "Unknown server error";
        return error;
    }
    error.requestType = body.getString("request_type");
    error.errorCode = static_cast<int>(body.getNumber("error_code"));
    error.reasonCode = static_cast<int>(body.getNumber("reason_code"));
    error.message = body.getString("error_message", "Unknown server error");
    return error;
}

} // namespace core
} // namespace voicestream
