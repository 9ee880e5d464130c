#include "transport/stream_connection.hpp"
#include "transport/url.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace voicestream {
namespace transport {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr int kAbnormalClosure = 1006;

// How long the destructor waits for a pending close handshake
constexpr std::chrono::milliseconds kCloseGracePeriod{2000};

/**
 * One secure WebSocket connection driven by its own io_context thread.
 * Everything except the public StreamConnection methods runs on that thread.
 * The owner must not destroy the object from inside an event callback.
 */
class BeastWebSocketConnection : public StreamConnection {
public:
    BeastWebSocketConnection(ParsedUrl url, ConnectionEvents events,
                             std::chrono::milliseconds handshakeTimeout)
        : url_(std::move(url)),
          events_(std::move(events)),
          handshakeTimeout_(handshakeTimeout),
          sslCtx_(ssl::context::tls_client),
          resolver_(ioc_),
          ws_(ioc_, sslCtx_) {
        sslCtx_.set_default_verify_paths();
        sslCtx_.set_verify_mode(ssl::verify_peer);
    }

    ~BeastWebSocketConnection() override {
        if (ioThread_.joinable()) {
            close();
            std::unique_lock<std::mutex> lock(doneMutex_);
            doneCondition_.wait_for(lock, kCloseGracePeriod, [this] { return done_; });
        }
        ioc_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
    }

    void start() {
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw utils::NetworkException("Failed to set TLS server name", ec.message());
        }
        ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));

        resolver_.async_resolve(url_.host, url_.port,
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                onResolve(ec, results);
            });
        ioThread_ = std::thread([this]() {
            ioc_.run();
            markDone();
        });
    }

    bool isOpen() const override {
        return open_.load();
    }

    void sendText(const std::string& frame) override {
        if (!open_.load()) {
            return;
        }
        buffered_ += frame.size();
        net::post(ioc_, [this, frame]() {
            if (!open_.load() || closing_) {
                buffered_ -= frame.size();
                return;
            }
            outbox_.push_back(frame);
            if (outbox_.size() == 1) {
                doWrite();
            }
        });
    }

    size_t bufferedAmount() const override {
        return buffered_.load();
    }

    void close() override {
        net::post(ioc_, [this]() {
            if (closing_ || terminated_) {
                return;
            }
            closing_ = true;
            if (!open_.load()) {
                // Still connecting: abort the pending operation
                resolver_.cancel();
                beast::get_lowest_layer(ws_).cancel();
                return;
            }
            if (outbox_.empty()) {
                doClose();
            }
        });
    }

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail("resolve", ec);
        }
        beast::get_lowest_layer(ws_).expires_after(handshakeTimeout_);
        beast::get_lowest_layer(ws_).async_connect(results,
            [this](beast::error_code connectEc, tcp::resolver::results_type::endpoint_type) {
                onConnect(connectEc);
            });
    }

    void onConnect(beast::error_code ec) {
        if (ec) {
            return fail("connect", ec);
        }
        beast::get_lowest_layer(ws_).expires_after(handshakeTimeout_);
        ws_.next_layer().async_handshake(ssl::stream_base::client,
            [this](beast::error_code tlsEc) { onTlsHandshake(tlsEc); });
    }

    void onTlsHandshake(beast::error_code ec) {
        if (ec) {
            return fail("TLS handshake", ec);
        }

        // The websocket stream has its own timeout settings
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent,
                    std::string("voicestream ") + BOOST_BEAST_VERSION_STRING);
        }));

        ws_.async_handshake(url_.host, url_.target,
            [this](beast::error_code wsEc) { onHandshake(wsEc); });
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            return fail("WebSocket handshake", ec);
        }
        if (closing_) {
            doClose();
            return;
        }

        ws_.text(true);
        open_ = true;
        utils::Logger::debug("WebSocket connected to " + url_.host);
        if (events_.onOpen) {
            events_.onOpen();
        }
        doRead();
    }

    void doRead() {
        ws_.async_read(readBuffer_,
            [this](beast::error_code ec, std::size_t bytes) { onRead(ec, bytes); });
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            return finish(static_cast<int>(reason.code), std::string(reason.reason.c_str()));
        }
        if (ec) {
            if (closing_ && ec == net::error::operation_aborted) {
                return finish(static_cast<int>(websocket::close_code::normal), "closed by client");
            }
            return fail("read", ec);
        }

        if (ws_.got_text() && events_.onText) {
            events_.onText(beast::buffers_to_string(readBuffer_.data()));
        }
        readBuffer_.consume(readBuffer_.size());
        doRead();
    }

    void doWrite() {
        ws_.async_write(net::buffer(outbox_.front()),
            [this](beast::error_code ec, std::size_t bytes) { onWrite(ec, bytes); });
    }

    void onWrite(beast::error_code ec, std::size_t) {
        buffered_ -= outbox_.front().size();
        outbox_.pop_front();

        if (ec) {
            while (!outbox_.empty()) {
                buffered_ -= outbox_.front().size();
                outbox_.pop_front();
            }
            return fail("write", ec);
        }

        if (!outbox_.empty()) {
            doWrite();
        } else if (closing_) {
            doClose();
        }
    }

    void doClose() {
        ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                return fail("close", ec);
            }
            finish(static_cast<int>(websocket::close_code::normal), "closed by client");
        });
    }

    void markDone() {
        {
            std::lock_guard<std::mutex> lock(doneMutex_);
            done_ = true;
        }
        doneCondition_.notify_all();
    }

    void fail(const std::string& what, beast::error_code ec) {
        if (terminated_) {
            return;
        }
        terminated_ = true;
        bool wasOpen = open_.exchange(false);

        std::string message = what + ": " + ec.message();
        if (events_.onError) {
            events_.onError(message);
        }
        if (wasOpen && events_.onClose) {
            events_.onClose(kAbnormalClosure, message);
        }
    }

    void finish(int code, const std::string& reason) {
        if (terminated_) {
            return;
        }
        terminated_ = true;
        open_ = false;
        utils::Logger::debug("WebSocket closed (" + std::to_string(code) + ")");
        if (events_.onClose) {
            events_.onClose(code, reason);
        }
    }

    ParsedUrl url_;
    ConnectionEvents events_;
    std::chrono::milliseconds handshakeTimeout_;

    net::io_context ioc_;
    ssl::context sslCtx_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer readBuffer_;

    // io thread only
    std::deque<std::string> outbox_;
    bool closing_ = false;
    bool terminated_ = false;

    std::atomic<size_t> buffered_{0};
    std::atomic<bool> open_{false};

    std::mutex doneMutex_;
    std::condition_variable doneCondition_;
    bool done_ = false;
    std::thread ioThread_;
};

} // namespace

BeastConnectionFactory::BeastConnectionFactory(std::chrono::milliseconds handshakeTimeout)
    : handshakeTimeout_(handshakeTimeout) {
}

std::shared_ptr<StreamConnection> BeastConnectionFactory::connect(const std::string& url,
                                                                  ConnectionEvents events) {
    ParsedUrl parsed;
    if (!parseUrl(url, parsed) || parsed.scheme != "wss") {
        throw utils::VoiceException("Invalid streaming URL: scheme must be wss://");
    }

    auto connection = std::make_shared<BeastWebSocketConnection>(std::move(parsed), std::move(events),
                                                                 handshakeTimeout_);
    connection->start();
    return connection;
}

} // namespace transport
} // namespace voicestream
