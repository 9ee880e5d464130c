#include "core/voice_stream_session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace voicestream {
namespace core {

VoiceStreamSession::VoiceStreamSession(std::shared_ptr<transport::VoiceClient> client,
                                       transport::SessionDescriptor descriptor,
                                       StreamOptions options,
                                       StreamCallbacks callbacks)
    : client_(std::move(client)),
      descriptor_(std::move(descriptor)),
      sessionId_(descriptor_.sessionId),
      options_(std::move(options)),
      callbacks_(std::move(callbacks)),
      source_(options_.sourceLanguage.empty() ? std::string(kAutoDetectLanguage) : options_.sourceLanguage) {
    if (!client_) {
        throw utils::ConfigException("VoiceStreamSession requires a VoiceClient");
    }
    targets_.reserve(options_.targetLanguages.size());
    for (const auto& language : options_.targetLanguages) {
        targets_.emplace_back(language);
    }
}

VoiceStreamSession::~VoiceStreamSession() {
    finish();
}

SessionResult VoiceStreamSession::run(audio::AudioChunkSource& source) {
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        if (started_) {
            throw utils::VoiceException("Voice stream session can only be run once", sessionId_);
        }
        started_ = true;
    }
    chunkSource_ = &source;

    try {
        connect();

        bool completed = false;
        SessionEvent event;
        while (!completed && events_.pop(event)) {
            if (event.kind != EventKind::PRODUCER_FAILED && event.generation != generation_.load()) {
                continue; // superseded connection
            }
            completed = handleEvent(event);
        }
        if (!completed) {
            throw utils::VoiceException("Voice stream session stopped before end of stream", sessionId_);
        }

        SessionResult result = buildResult();
        finish();
        state_ = SessionState::COMPLETED;
        utils::Logger::info("Voice session " + sessionId_ + " completed (" +
                            std::to_string(reconnectAttempts_.load()) + " reconnects)");
        return result;
    } catch (const std::exception& e) {
        state_ = SessionState::FAILED;
        finish();
        utils::ErrorHandler::getInstance().reportError(e, "voice stream session", sessionId_);
        throw;
    } catch (...) {
        // Non-standard exception from the chunk source: clean up and pass it on
        state_ = SessionState::FAILED;
        finish();
        throw;
    }
}

void VoiceStreamSession::cancel() {
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        if (!started_ || resolved_ || cancelled_) {
            return;
        }
        cancelled_ = true;
        sendEndOfSourceLocked();
    }
    connectionCondition_.notify_all();
    utils::Logger::info("Voice session " + sessionId_ + " cancelled, waiting for final transcripts");
}

transport::ConnectionHandlers VoiceStreamSession::makeHandlers(uint64_t generation) {
    auto tagged = [generation](EventKind kind) {
        SessionEvent event;
        event.kind = kind;
        event.generation = generation;
        return event;
    };

    transport::ConnectionHandlers handlers;
    handlers.onOpen = [this, tagged]() {
        post(tagged(EventKind::OPENED));
    };
    handlers.onSourceTranscript = [this, tagged](const transport::TranscriptUpdate& update) {
        SessionEvent event = tagged(EventKind::SOURCE_TRANSCRIPT);
        event.update = update;
        post(std::move(event));
    };
    handlers.onTargetTranscript = [this, tagged](const transport::TranscriptUpdate& update) {
        SessionEvent event = tagged(EventKind::TARGET_TRANSCRIPT);
        event.update = update;
        post(std::move(event));
    };
    handlers.onEndOfSourceTranscript = [this, tagged]() {
        post(tagged(EventKind::END_OF_SOURCE_TRANSCRIPT));
    };
    handlers.onEndOfTargetTranscript = [this, tagged](const std::string& language) {
        SessionEvent event = tagged(EventKind::END_OF_TARGET_TRANSCRIPT);
        event.text = language;
        post(std::move(event));
    };
    handlers.onEndOfStream = [this, tagged]() {
        post(tagged(EventKind::END_OF_STREAM));
    };
    handlers.onError = [this, tagged](const transport::ServerError& error) {
        SessionEvent event = tagged(EventKind::SERVER_ERROR);
        event.error = error;
        post(std::move(event));
    };
    handlers.onConnectionError = [this, tagged](const std::string& message) {
        SessionEvent event = tagged(EventKind::CONNECTION_ERROR);
        event.text = message;
        post(std::move(event));
    };
    handlers.onClose = [this, tagged](int code, const std::string& reason) {
        SessionEvent event = tagged(EventKind::CLOSED);
        event.code = code;
        event.text = reason;
        post(std::move(event));
    };
    return handlers;
}

void VoiceStreamSession::post(SessionEvent event) {
    if (!events_.push(std::move(event))) {
        utils::Logger::debug("Voice session " + sessionId_ + ": dropping event after session end");
    }
}

void VoiceStreamSession::connect() {
    const uint64_t generation = ++generation_;
    connectionOpened_ = false;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        connectionReady_ = false;
        endOfSourceSent_ = false;
    }
    state_ = SessionState::CONNECTING;

    auto connection = client_->openConnection(descriptor_.streamingUrl, descriptor_.token,
                                              makeHandlers(generation));

    std::lock_guard<std::mutex> lock(connectionMutex_);
    activeConnection_ = std::move(connection);
}

bool VoiceStreamSession::handleEvent(const SessionEvent& event) {
    switch (event.kind) {
        case EventKind::OPENED:
            handleOpened();
            break;

        case EventKind::SOURCE_TRANSCRIPT:
            source_.addConcluded(event.update.concluded);
            if (callbacks_.onSourceTranscript) {
                callbacks_.onSourceTranscript(event.update);
            }
            break;

        case EventKind::TARGET_TRANSCRIPT:
            if (TranscriptAccumulator* target = findTarget(event.update.language)) {
                target->addConcluded(event.update.concluded);
            }
            if (callbacks_.onTargetTranscript) {
                callbacks_.onTargetTranscript(event.update);
            }
            break;

        case EventKind::END_OF_SOURCE_TRANSCRIPT:
            source_.freeze();
            if (callbacks_.onEndOfSourceTranscript) {
                callbacks_.onEndOfSourceTranscript();
            }
            break;

        case EventKind::END_OF_TARGET_TRANSCRIPT:
            if (TranscriptAccumulator* target = findTarget(event.text)) {
                target->freeze();
            }
            if (callbacks_.onEndOfTargetTranscript) {
                callbacks_.onEndOfTargetTranscript(event.text);
            }
            break;

        case EventKind::END_OF_STREAM:
            if (callbacks_.onEndOfStream) {
                callbacks_.onEndOfStream();
            }
            return true;

        case EventKind::SERVER_ERROR:
            if (callbacks_.onError) {
                callbacks_.onError(event.error);
            }
            throw utils::ProtocolException(
                "Voice streaming error: " + event.error.message + " (" +
                    std::to_string(event.error.errorCode) + ")",
                event.error.requestType, event.error.errorCode, event.error.reasonCode, sessionId_);

        case EventKind::CONNECTION_ERROR:
            if (!connectionOpened_) {
                throw utils::VoiceException("WebSocket connection failed: " + event.text, sessionId_);
            }
            handleUnexpectedClosure(event.text);
            break;

        case EventKind::CLOSED:
            handleUnexpectedClosure("code " + std::to_string(event.code) +
                                    (event.text.empty() ? "" : ": " + event.text));
            break;

        case EventKind::PRODUCER_FAILED:
            closeConnection();
            std::rethrow_exception(event.exception);
    }
    return false;
}

void VoiceStreamSession::handleOpened() {
    connectionOpened_ = true;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        connectionReady_ = true;
        state_ = SessionState::STREAMING;
        // A source that ran dry or a cancel during reconnect still owes the
        // new connection its end-of-source
        if (producerExhausted_ || cancelled_) {
            sendEndOfSourceLocked();
        }
    }
    connectionCondition_.notify_all();

    if (reconnectAttempts_.load() > 0) {
        utils::Logger::info("Voice session " + sessionId_ + " reconnected");
    } else {
        utils::Logger::info("Voice session " + sessionId_ + " streaming");
    }

    if (!senderStarted_) {
        senderStarted_ = true;
        audio::AudioChunkSource* source = chunkSource_;
        sender_ = std::thread([this, source]() { senderLoop(*source); });
    }
}

void VoiceStreamSession::handleUnexpectedClosure(const std::string& reason) {
    if (!options_.reconnect || reconnectAttempts_.load() >= options_.maxReconnectAttempts) {
        utils::Logger::error("Voice session " + sessionId_ + " lost its connection: " + reason);
        throw utils::VoiceException("WebSocket closed unexpectedly", sessionId_);
    }

    const int attempt = ++reconnectAttempts_;
    state_ = SessionState::RECONNECTING;

    // Anything the old connection still reports is stale from here on
    ++generation_;
    closeConnection();

    utils::Logger::warn("Voice session " + sessionId_ + " lost its connection (" + reason +
                        "), reconnecting (attempt " + std::to_string(attempt) + "/" +
                        std::to_string(options_.maxReconnectAttempts) + ")");
    if (callbacks_.onReconnecting) {
        callbacks_.onReconnecting(attempt);
    }

    transport::SessionDescriptor renewed = client_->reconnectSession(descriptor_.token);
    descriptor_.streamingUrl = renewed.streamingUrl;
    descriptor_.token = renewed.token;

    connect();
}

void VoiceStreamSession::senderLoop(audio::AudioChunkSource& source) {
    try {
        std::vector<uint8_t> chunk;
        size_t chunksSent = 0;

        while (true) {
            {
                std::lock_guard<std::mutex> lock(connectionMutex_);
                if (stopSender_ || cancelled_) {
                    return;
                }
            }

            if (!source.nextChunk(chunk)) {
                std::lock_guard<std::mutex> lock(connectionMutex_);
                producerExhausted_ = true;
                sendEndOfSourceLocked();
                utils::Logger::debug("Audio source exhausted after " + std::to_string(chunksSent) + " chunks");
                return;
            }

            bool belowHighWaterMark = true;
            {
                std::unique_lock<std::mutex> lock(connectionMutex_);
                if (!waitForConnection(lock)) {
                    return;
                }
                belowHighWaterMark = client_->sendAudioChunk(*activeConnection_, chunk);
            }
            ++chunksSent;

            if (!belowHighWaterMark && !waitForCapacity()) {
                return;
            }

            if (options_.chunkInterval.count() > 0) {
                std::unique_lock<std::mutex> lock(connectionMutex_);
                if (connectionCondition_.wait_for(lock, options_.chunkInterval,
                                                  [this] { return stopSender_ || cancelled_; })) {
                    return;
                }
            }
        }
    } catch (...) {
        // Hand the source's failure to the run thread, which rethrows it as is
        SessionEvent event;
        event.kind = EventKind::PRODUCER_FAILED;
        event.exception = std::current_exception();
        post(std::move(event));
    }
}

bool VoiceStreamSession::waitForConnection(std::unique_lock<std::mutex>& lock) {
    connectionCondition_.wait(lock, [this] {
        return stopSender_ || cancelled_ || (connectionReady_ && activeConnection_);
    });
    return !stopSender_ && !cancelled_;
}

bool VoiceStreamSession::waitForCapacity() {
    for (int round = 0; round < options_.maxFlowControlWaits; ++round) {
        std::unique_lock<std::mutex> lock(connectionMutex_);
        if (connectionCondition_.wait_for(lock, options_.flowControlBackoff,
                                          [this] { return stopSender_ || cancelled_; })) {
            return false;
        }
        if (!connectionReady_ || !activeConnection_ || client_->hasSendCapacity(*activeConnection_)) {
            return true;
        }
    }
    utils::Logger::warn("Voice session " + sessionId_ + ": send buffer still above high-water mark");
    return true;
}

void VoiceStreamSession::sendEndOfSourceLocked() {
    if (endOfSourceSent_ || !connectionReady_ || !activeConnection_) {
        return;
    }
    client_->sendEndOfSource(*activeConnection_);
    endOfSourceSent_ = true;
    utils::Logger::debug("Voice session " + sessionId_ + ": end of source sent");
}

void VoiceStreamSession::finish() {
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        resolved_ = true;
        stopSender_ = true;
    }
    connectionCondition_.notify_all();

    if (sender_.joinable()) {
        sender_.join();
    }
    closeConnection();
    events_.shutdown();
}

void VoiceStreamSession::closeConnection() {
    std::shared_ptr<transport::StreamConnection> connection;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        connection = std::move(activeConnection_);
        activeConnection_.reset();
        connectionReady_ = false;
    }
    if (connection) {
        connection->close();
    }
}

TranscriptAccumulator* VoiceStreamSession::findTarget(const std::string& language) {
    for (auto& target : targets_) {
        if (target.requestedLanguage() == language) {
            return &target;
        }
    }
    return nullptr;
}

SessionResult VoiceStreamSession::buildResult() const {
    SessionResult result;
    result.sessionId = sessionId_;
    result.source = source_.toTranscript();
    result.targets.reserve(targets_.size());
    for (const auto& target : targets_) {
        result.targets.push_back(target.toTranscript());
    }
    return result;
}

} // namespace core
} // namespace voicestream
