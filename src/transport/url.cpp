#include "transport/url.hpp"
#include <algorithm>
#include <cctype>

namespace voicestream {
namespace transport {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string defaultPort(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") return "443";
    if (scheme == "http" || scheme == "ws") return "80";
    return "";
}

} // namespace

bool parseUrl(const std::string& url, ParsedUrl& out) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));
    for (char c : parsed.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    if (defaultPort(parsed.scheme).empty()) {
        return false;
    }

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                           ? std::string::npos
                                                           : authorityEnd - authorityStart);
    if (authority.empty() || authority.find('@') != std::string::npos ||
        authority.find('[') != std::string::npos) {
        return false;
    }

    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
        if (parsed.port.empty() ||
            !std::all_of(parsed.port.begin(), parsed.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
    } else {
        parsed.host = authority;
        parsed.port = defaultPort(parsed.scheme);
    }

    if (parsed.host.empty()) {
        return false;
    }
    for (char c : parsed.host) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
            return false;
        }
    }
    parsed.host = toLower(parsed.host);

    if (authorityEnd == std::string::npos) {
        parsed.target = "/";
    } else {
        std::string rest = url.substr(authorityEnd);
        auto hash = rest.find('#');
        if (hash != std::string::npos) {
            rest = rest.substr(0, hash);
        }
        parsed.target = (rest.empty() || rest[0] != '/') ? "/" + rest : rest;
    }

    out = parsed;
    return true;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

bool hostMatchesDomain(const std::string& host, const std::string& domain) {
    std::string h = toLower(host);
    std::string d = toLower(domain);
    if (d.empty()) {
        return false;
    }
    if (h == d) {
        return true;
    }
    return h.size() > d.size() + 1 &&
           h.compare(h.size() - d.size(), d.size(), d) == 0 &&
           h[h.size() - d.size() - 1] == '.';
}

} // namespace transport
} // namespace voicestream
