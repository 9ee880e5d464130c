#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "audio/chunk_source.hpp"
#include "core/event_channel.hpp"
#include "core/stream_types.hpp"
#include "core/transcript_accumulator.hpp"
#include "transport/voice_client.hpp"

namespace voicestream {
namespace core {

/**
 * One real-time translation stream.
 *
 * run() opens the streaming connection, pulls audio from the chunk source on
 * a sender thread and processes server events on the calling thread until the
 * server signals end of stream. Unexpected closures are retried through the
 * reconnect endpoint up to StreamOptions::maxReconnectAttempts times.
 *
 * Connection callbacks never touch session state directly; they post events
 * tagged with the connection generation, and events of a superseded
 * connection are dropped.
 */
class VoiceStreamSession {
public:
    VoiceStreamSession(std::shared_ptr<transport::VoiceClient> client,
                       transport::SessionDescriptor descriptor,
                       StreamOptions options,
                       StreamCallbacks callbacks = {});
    ~VoiceStreamSession();

    VoiceStreamSession(const VoiceStreamSession&) = delete;
    VoiceStreamSession& operator=(const VoiceStreamSession&) = delete;

    /**
     * Stream `source` to completion. Blocks; may be called once.
     *
     * Throws ProtocolException on a server error frame, VoiceException when the
     * connection fails or closes unexpectedly past the reconnect limit, the
     * reconnect call's own exception when it fails, and the chunk source's
     * exception unchanged when the source throws.
     */
    SessionResult run(audio::AudioChunkSource& source);

    /**
     * Ask the server to finish: sends end-of-source once and stops pulling
     * chunks. run() still returns normally once the server ends the stream.
     * No-op before run(), after it returned, and on repeated calls.
     */
    void cancel();

    SessionState getState() const { return state_.load(); }
    int getReconnectAttempts() const { return reconnectAttempts_.load(); }
    const std::string& getSessionId() const { return sessionId_; }

private:
    enum class EventKind {
        OPENED,
        SOURCE_TRANSCRIPT,
        TARGET_TRANSCRIPT,
        END_OF_SOURCE_TRANSCRIPT,
        END_OF_TARGET_TRANSCRIPT,
        END_OF_STREAM,
        SERVER_ERROR,
        CONNECTION_ERROR,
        CLOSED,
        PRODUCER_FAILED
    };

    struct SessionEvent {
        EventKind kind = EventKind::CLOSED;
        uint64_t generation = 0;
        transport::TranscriptUpdate update;
        std::string text;              // language or error / close reason
        int code = 0;                  // close code
        transport::ServerError error;
        std::exception_ptr exception;
    };

    transport::ConnectionHandlers makeHandlers(uint64_t generation);
    void post(SessionEvent event);

    void connect();
    bool handleEvent(const SessionEvent& event);
    void handleOpened();
    void handleUnexpectedClosure(const std::string& reason);

    void senderLoop(audio::AudioChunkSource& source);
    bool waitForCapacity();
    bool waitForConnection(std::unique_lock<std::mutex>& lock);
    void sendEndOfSourceLocked();

    void finish();
    void closeConnection();
    TranscriptAccumulator* findTarget(const std::string& language);
    SessionResult buildResult() const;

    std::shared_ptr<transport::VoiceClient> client_;
    transport::SessionDescriptor descriptor_;
    const std::string sessionId_;
    StreamOptions options_;
    StreamCallbacks callbacks_;

    // Run thread only
    TranscriptAccumulator source_;
    std::vector<TranscriptAccumulator> targets_;
    bool connectionOpened_ = false;
    bool senderStarted_ = false;
    audio::AudioChunkSource* chunkSource_ = nullptr;

    EventChannel<SessionEvent> events_;
    std::atomic<SessionState> state_{SessionState::CONNECTING};
    std::atomic<int> reconnectAttempts_{0};
    std::atomic<uint64_t> generation_{0};

    // Guarded by connectionMutex_
    std::mutex connectionMutex_;
    std::condition_variable connectionCondition_;
    std::shared_ptr<transport::StreamConnection> activeConnection_;
    bool connectionReady_ = false;
    bool endOfSourceSent_ = false;
    bool producerExhausted_ = false;
    bool cancelled_ = false;
    bool started_ = false;
    bool resolved_ = false;
    bool stopSender_ = false;

    std::thread sender_;
};

} // namespace core
} // namespace voicestream
