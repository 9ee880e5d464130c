#include "audio/chunk_source.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voicestream {
namespace audio {

StreamChunkSource::StreamChunkSource(std::istream& input, size_t chunkSize)
    : input_(input), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw utils::ValidationException("Chunk size must be greater than zero");
    }
}

bool StreamChunkSource::nextChunk(std::vector<uint8_t>& chunk) {
    chunk.resize(chunkSize_);
    input_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunkSize_));
    const auto count = static_cast<size_t>(input_.gcount());

    if (input_.bad()) {
        throw utils::ValidationException("Failed to read audio input");
    }

    chunk.resize(count);
    bytesRead_ += count;
    return count > 0;
}

FileChunkSource::FileChunkSource(const std::string& path, size_t chunkSize)
    : path_(path),
      file_(path, std::ios::binary),
      reader_(file_, chunkSize) {
    if (!file_.is_open()) {
        throw utils::ValidationException("Audio file not found or not readable: " + path);
    }
    utils::Logger::debug("Streaming audio from " + path);
}

bool FileChunkSource::nextChunk(std::vector<uint8_t>& chunk) {
    return reader_.nextChunk(chunk);
}

} // namespace audio
} // namespace voicestream
