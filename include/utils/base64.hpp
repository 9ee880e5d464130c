#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voicestream {
namespace utils {

// Standard (RFC 4648) base64 with padding, backed by OpenSSL's EVP block codec.
std::string encodeBase64(const uint8_t* data, size_t size);
std::string encodeBase64(const std::vector<uint8_t>& data);

// Throws std::invalid_argument on malformed input.
std::vector<uint8_t> decodeBase64(const std::string& encoded);

} // namespace utils
} // namespace voicestream
