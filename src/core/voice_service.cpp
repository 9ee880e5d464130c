#include "core/voice_service.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace voicestream {
namespace core {

namespace {

const std::map<std::string, std::string> kContentTypes = {
    {".ogg", "audio/opus;container=ogg"},
    {".opus", "audio/opus;container=ogg"},
    {".webm", "audio/opus;container=webm"},
    {".mka", "audio/opus;container=matroska"},
    {".flac", "audio/flac"},
    {".mp3", "audio/mpeg"},
    {".pcm", "audio/pcm;encoding=s16le;rate=16000"},
    {".raw", "audio/pcm;encoding=s16le;rate=16000"},
};

std::string extensionOf(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string extension = path.substr(dot);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace

VoiceService::VoiceService(std::shared_ptr<transport::VoiceClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw utils::ConfigException("VoiceClient is required");
    }
}

SessionResult VoiceService::translateFile(const std::string& path, StreamOptions options,
                                          const StreamCallbacks& callbacks) {
    validateOptions(options);

    if (options.contentType.empty()) {
        options.contentType = detectContentType(path);
    }
    if (options.contentType.empty()) {
        throw utils::ValidationException("Cannot detect audio format for \"" + path +
                                         "\". Specify the content type explicitly.");
    }

    audio::FileChunkSource source(path, options.chunkSize);
    return translate(source, options, callbacks);
}

SessionResult VoiceService::translateStream(std::istream& input, const StreamOptions& options,
                                            const StreamCallbacks& callbacks) {
    validateOptions(options);

    if (options.contentType.empty()) {
        throw utils::ValidationException(
            "Content type is required when reading from a stream. Specify the audio format.");
    }

    audio::StreamChunkSource source(input, options.chunkSize);
    return translate(source, options, callbacks);
}

SessionResult VoiceService::translate(audio::AudioChunkSource& source, const StreamOptions& options,
                                      const StreamCallbacks& callbacks) {
    validateOptions(options);
    if (options.contentType.empty()) {
        throw utils::ValidationException("Source media content type is required");
    }

    transport::SessionRequest request;
    request.targetLanguages = options.targetLanguages;
    request.sourceMediaContentType = options.contentType;
    request.sourceLanguage = options.sourceLanguage;
    request.sourceLanguageMode = options.sourceLanguageMode;
    request.formality = options.formality;
    request.glossaryId = options.glossaryId;

    transport::SessionDescriptor descriptor = client_->createSession(request);

    auto session = std::make_shared<VoiceStreamSession>(client_, descriptor, options, callbacks);
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        activeSession_ = session;
    }

    try {
        SessionResult result = session->run(source);
        std::lock_guard<std::mutex> lock(sessionMutex_);
        activeSession_.reset();
        return result;
    } catch (...) {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        activeSession_.reset();
        throw;
    }
}

void VoiceService::cancel() {
    std::shared_ptr<VoiceStreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session = activeSession_;
    }
    if (session) {
        session->cancel();
    }
}

void VoiceService::validateOptions(const StreamOptions& options) {
    if (options.targetLanguages.empty()) {
        throw utils::ValidationException("At least one target language is required.");
    }
    if (options.targetLanguages.size() > kMaxTargetLanguages) {
        throw utils::ValidationException("Maximum " + std::to_string(kMaxTargetLanguages) +
                                         " target languages allowed, got " +
                                         std::to_string(options.targetLanguages.size()) + ".");
    }
    if (options.chunkSize == 0) {
        throw utils::ValidationException("Chunk size must be greater than zero.");
    }
}

std::string VoiceService::detectContentType(const std::string& path) {
    auto it = kContentTypes.find(extensionOf(path));
    return it != kContentTypes.end() ? it->second : "";
}

StreamOptions VoiceService::optionsFromConfig(const utils::VoiceConfig& config) {
    StreamOptions options;
    options.targetLanguages = config.targetLanguages;
    options.sourceLanguage = config.sourceLanguage;
    options.formality = config.formality;
    options.glossaryId = config.glossaryId;
    options.contentType = config.contentType;
    options.chunkSize = config.chunkSize;
    options.chunkInterval = std::chrono::milliseconds(config.chunkIntervalMs);
    options.reconnect = config.reconnect;
    options.maxReconnectAttempts = config.maxReconnectAttempts;
    return options;
}

} // namespace core
} // namespace voicestream
