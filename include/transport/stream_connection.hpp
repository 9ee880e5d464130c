#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace voicestream {
namespace transport {

/**
 * Low-level events of one WebSocket connection. They are invoked on the
 * connection's I/O thread and must not block.
 *
 * onError reports socket-level failures (resolve, connect, TLS, handshake,
 * read/write). A connection that was open additionally reports onClose
 * after onError. A connection that never opened reports onError only.
 */
struct ConnectionEvents {
    std::function<void()> onOpen;
    std::function<void(const std::string& frame)> onText;
    std::function<void(const std::string& message)> onError;
    std::function<void(int code, const std::string& reason)> onClose;
};

/**
 * A text-frame WebSocket connection. All methods are thread-safe.
 */
class StreamConnection {
public:
    virtual ~StreamConnection() = default;

    virtual bool isOpen() const = 0;

    /**
     * Queue a text frame. Frames are discarded when the connection is not open.
     */
    virtual void sendText(const std::string& frame) = 0;

    /**
     * Bytes queued by sendText() and not yet written to the socket.
     */
    virtual size_t bufferedAmount() const = 0;

    /**
     * Start a normal close after queued frames are flushed. Idempotent.
     */
    virtual void close() = 0;
};

/**
 * Creates connections. connect() returns immediately; the outcome is
 * reported through the events.
 */
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    virtual std::shared_ptr<StreamConnection> connect(const std::string& url,
                                                      ConnectionEvents events) = 0;
};

/**
 * Secure WebSocket connections on Boost.Beast, one I/O thread per connection.
 */
class BeastConnectionFactory : public ConnectionFactory {
public:
    explicit BeastConnectionFactory(std::chrono::milliseconds handshakeTimeout);

    std::shared_ptr<StreamConnection> connect(const std::string& url,
                                              ConnectionEvents events) override;

private:
    std::chrono::milliseconds handshakeTimeout_;
};

} // namespace transport
} // namespace voicestream
