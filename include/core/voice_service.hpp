#pragma once

#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include "audio/chunk_source.hpp"
#include "core/stream_types.hpp"
#include "core/voice_stream_session.hpp"
#include "transport/voice_client.hpp"
#include "utils/config.hpp"

namespace voicestream {
namespace core {

/**
 * Entry point for translating a recording or a live stream: validates the
 * options, creates the remote session and runs a VoiceStreamSession over
 * the audio. One translation at a time may be cancelled through cancel().
 */
class VoiceService {
public:
    static constexpr size_t kMaxTargetLanguages = 5;

    explicit VoiceService(std::shared_ptr<transport::VoiceClient> client);

    /**
     * Translate an audio file. The content type is taken from the options or
     * detected from the file extension.
     */
    SessionResult translateFile(const std::string& path, StreamOptions options,
                                const StreamCallbacks& callbacks = {});

    // Translate audio read from `input` (e.g. stdin). options.contentType is required.
    SessionResult translateStream(std::istream& input, const StreamOptions& options,
                                  const StreamCallbacks& callbacks = {});

    SessionResult translate(audio::AudioChunkSource& source, const StreamOptions& options,
                            const StreamCallbacks& callbacks = {});

    // Forward to the running session, if any
    void cancel();

    /**
     * Throws ValidationException unless there are 1 to kMaxTargetLanguages
     * target languages and a non-zero chunk size.
     */
    static void validateOptions(const StreamOptions& options);

    // Content type for a file extension, or an empty string if unknown
    static std::string detectContentType(const std::string& path);

    // Stream defaults from the configuration
    static StreamOptions optionsFromConfig(const utils::VoiceConfig& config);

private:
    std::shared_ptr<transport::VoiceClient> client_;

    std::mutex sessionMutex_;
    std::shared_ptr<VoiceStreamSession> activeSession_;
};

} // namespace core
} // namespace voicestream
