#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace voicestream {
namespace audio {

/**
 * Pull-based producer of audio chunks. The bytes are opaque to the library.
 * nextChunk() may block; it is only ever called from one thread at a time.
 */
class AudioChunkSource {
public:
    virtual ~AudioChunkSource() = default;

    /**
     * Fill `chunk` with the next piece of audio. Returns false when the source
     * is exhausted. May throw; the error ends the session unchanged.
     */
    virtual bool nextChunk(std::vector<uint8_t>& chunk) = 0;
};

/**
 * Reads fixed-size chunks from an input stream (stdin, a pipe, ...).
 * The last chunk may be shorter.
 */
class StreamChunkSource : public AudioChunkSource {
public:
    StreamChunkSource(std::istream& input, size_t chunkSize);

    bool nextChunk(std::vector<uint8_t>& chunk) override;

    size_t getBytesRead() const { return bytesRead_; }

private:
    std::istream& input_;
    size_t chunkSize_;
    size_t bytesRead_ = 0;
};

// Reads fixed-size chunks from a file. Throws ValidationException if it cannot be opened.
class FileChunkSource : public AudioChunkSource {
public:
    FileChunkSource(const std::string& path, size_t chunkSize);

    bool nextChunk(std::vector<uint8_t>& chunk) override;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
    StreamChunkSource reader_;
};

} // namespace audio
} // namespace voicestream
