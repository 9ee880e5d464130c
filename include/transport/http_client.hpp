#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include "transport/url.hpp"

namespace voicestream {
namespace transport {

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";    // path plus query
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // names lower-cased

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Abstract request/response transport used by the REST side of the client.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform one request. Returns any HTTP status; throws NetworkException
     * when no response could be obtained.
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * HTTPS transport on Boost.Beast. One TLS connection per request.
 */
class BeastHttpClient : public HttpTransport {
public:
    BeastHttpClient(const std::string& baseUrl, std::chrono::milliseconds timeout);

    HttpResponse send(const HttpRequest& request) override;

private:
    ParsedUrl base_;
    std::chrono::milliseconds timeout_;
};

} // namespace transport
} // namespace voicestream
