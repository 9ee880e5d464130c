#include "utils/base64.hpp"
#include <openssl/evp.h>
#include <limits>
#include <stdexcept>

namespace voicestream {
namespace utils {

std::string encodeBase64(const uint8_t* data, size_t size) {
    if (size == 0) {
        return std::string();
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::length_error("Chunk too large for base64 encoding");
    }

    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(size));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string encodeBase64(const std::vector<uint8_t>& data) {
    return encodeBase64(data.data(), data.size());
}

std::vector<uint8_t> decodeBase64(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 length");
    }

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("Invalid base64 input");
    }

    // EVP_DecodeBlock does not account for padding
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace utils
} // namespace voicestream
