#include "transport/http_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include <algorithm>
#include <cctype>

namespace voicestream {
namespace transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

http::verb verbFor(const std::string& method) {
    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw utils::ValidationException("Unsupported HTTP method: " + method);
    }
    return verb;
}

/**
 * Start one async operation, drive the io_context until it completes and
 * turn a failure into a NetworkException. Async operations are used so the
 * tcp_stream expiry applies.
 */
template <class Initiation>
void runStep(net::io_context& ioc, const std::string& what, Initiation&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.run();
    ioc.restart();
    if (result) {
        throw utils::NetworkException(what + " failed", result.message());
    }
}

} // namespace

BeastHttpClient::BeastHttpClient(const std::string& baseUrl, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    if (!parseUrl(baseUrl, base_) || base_.scheme != "https") {
        throw utils::ConfigException("Invalid API base URL (https required): " + baseUrl);
    }
    if (base_.target == "/") {
        base_.target.clear();
    }
}

HttpResponse BeastHttpClient::send(const HttpRequest& request) {
    net::io_context ioc;
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), base_.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw utils::NetworkException("Failed to set TLS server name", ec.message());
    }
    stream.set_verify_callback(ssl::host_name_verification(base_.host));

    beast::error_code ec;
    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(base_.host, base_.port, ec);
    if (ec) {
        throw utils::NetworkException("Could not resolve " + base_.host, ec.message());
    }

    auto& tcpLayer = beast::get_lowest_layer(stream);
    tcpLayer.expires_after(timeout_);
    runStep(ioc, "Connect to " + base_.host, [&](auto handler) {
        tcpLayer.async_connect(endpoints, std::move(handler));
    });

    tcpLayer.expires_after(timeout_);
    runStep(ioc, "TLS handshake with " + base_.host, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });

    http::request<http::string_body> req{verbFor(request.method), base_.target + request.target, 11};
    req.set(http::field::host, base_.host);
    req.set(http::field::user_agent, std::string("voicestream ") + BOOST_BEAST_VERSION_STRING);
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();

    utils::Logger::debug("HTTP " + request.method + " " + base_.host + base_.target +
                         request.target.substr(0, request.target.find('?')));

    tcpLayer.expires_after(timeout_);
    runStep(ioc, "HTTP request", [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    tcpLayer.expires_after(timeout_);
    runStep(ioc, "HTTP response", [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });

    tcpLayer.expires_after(timeout_);
    stream.async_shutdown([&ec](beast::error_code shutdownEc) { ec = shutdownEc; });
    ioc.run();
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        utils::Logger::debug("TLS shutdown: " + ec.message());
    }

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res.base()) {
        const auto fieldName = field.name_string();
        const auto fieldValue = field.value();
        std::string name(fieldName.data(), fieldName.size());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        response.headers[name] = std::string(fieldValue.data(), fieldValue.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace transport
} // namespace voicestream
