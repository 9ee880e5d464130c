#pragma once

#include <string>

namespace voicestream {
namespace transport {

struct ParsedUrl {
    std::string scheme; // lower-cased
    std::string host;   // lower-cased
    std::string port;   // explicit port or the scheme default
    std::string target; // path plus query, at least "/"
};

/**
 * Parse an absolute http(s)/ws(s) URL. Userinfo, IPv6 literals and
 * fragments are not supported. Returns false on malformed input.
 */
bool parseUrl(const std::string& url, ParsedUrl& out);

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

// True when host equals domain or is a subdomain of it (case-insensitive).
bool hostMatchesDomain(const std::string& host, const std::string& domain);

} // namespace transport
} // namespace voicestream
