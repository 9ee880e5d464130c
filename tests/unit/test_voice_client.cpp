#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <chrono>
#include "fixtures/fake_voice_transport.hpp"
#include "transport/voice_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"

using namespace voicestream;
using test::FakeConnection;
using test::FakeConnectionFactory;
using test::MockHttpTransport;
using test::jsonResponse;
using test::sessionJson;
using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;

class VoiceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<MockHttpTransport>();
        factory = std::make_shared<FakeConnectionFactory>();

        // One response per call; retries are covered separately below
        client = makeClient(0);
    }

    std::shared_ptr<transport::VoiceClient> makeClient(int maxRetries,
                                                       std::chrono::milliseconds initialDelay = std::chrono::milliseconds(1)) {
        transport::VoiceClientOptions options;
        options.apiKey = "test-key";
        options.highWaterMarkBytes = 1000;
        options.maxRetries = maxRetries;
        options.retryInitialDelay = initialDelay;
        options.retryMaxDelay = std::max(initialDelay, std::chrono::milliseconds(4));
        return std::make_shared<transport::VoiceClient>(options, http, factory);
    }

    std::shared_ptr<FakeConnection> openedConnection(transport::ConnectionHandlers handlers = {}) {
        client->openConnection("wss://voice.deepl.com/stream", "tok", std::move(handlers));
        auto connection = factory->connection(factory->connectionCount() - 1);
        connection->simulateOpen();
        return connection;
    }

    transport::SessionRequest defaultRequest() {
        transport::SessionRequest request;
        request.targetLanguages = {"de", "fr"};
        request.sourceMediaContentType = "audio/opus;container=ogg";
        return request;
    }

    std::shared_ptr<MockHttpTransport> http;
    std::shared_ptr<FakeConnectionFactory> factory;
    std::shared_ptr<transport::VoiceClient> client;
};

TEST_F(VoiceClientTest, RequiresApiKey) {
    transport::VoiceClientOptions options;
    EXPECT_THROW(transport::VoiceClient(options, http, factory), utils::AuthException);
}

TEST_F(VoiceClientTest, CreateSessionSendsAuthorizedJsonRequest) {
    transport::HttpRequest captured;
    EXPECT_CALL(*http, send(_))
        .WillOnce(::testing::DoAll(SaveArg<0>(&captured),
                                   Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "t1", "sid-1")))));

    transport::SessionRequest request = defaultRequest();
    request.sourceLanguage = "en";
    request.formality = "more";

    transport::SessionDescriptor descriptor = client->createSession(request);

    EXPECT_EQ(descriptor.streamingUrl, "wss://voice.deepl.com/s");
    EXPECT_EQ(descriptor.token, "t1");
    EXPECT_EQ(descriptor.sessionId, "sid-1");

    EXPECT_EQ(captured.method, "POST");
    EXPECT_EQ(captured.target, "/v3/voice/realtime");
    EXPECT_EQ(captured.headers["Authorization"], "DeepL-Auth-Key test-key");
    EXPECT_EQ(captured.headers["Content-Type"], "application/json");

    utils::JsonValue body = utils::JsonParser::parse(captured.body);
    ASSERT_TRUE(body.getProperty("target_languages").isArray());
    ASSERT_EQ(body.getProperty("target_languages").asArray().size(), 2u);
    EXPECT_EQ(body.getProperty("target_languages").asArray()[0].asString(), "de");
    EXPECT_EQ(body.getString("source_media_content_type"), "audio/opus;container=ogg");
    EXPECT_EQ(body.getString("source_language"), "en");
    EXPECT_EQ(body.getString("formality"), "more");
    EXPECT_FALSE(body.hasProperty("glossary_id"));
    EXPECT_FALSE(body.hasProperty("source_language_mode"));
}

TEST_F(VoiceClientTest, CreateSessionRequiresAllDescriptorFields) {
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "t1"))))
        .WillOnce(Return(jsonResponse(200, R"({"token":"t1","session_id":"s"})")))
        .WillOnce(Return(jsonResponse(200, "<html>")));

    EXPECT_THROW(client->createSession(defaultRequest()), utils::VoiceException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::VoiceException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::VoiceException);
}

TEST_F(VoiceClientTest, ReconnectSessionEncodesToken) {
    transport::HttpRequest captured;
    EXPECT_CALL(*http, send(_))
        .WillOnce(::testing::DoAll(SaveArg<0>(&captured),
                                   Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/r", "t2")))));

    transport::SessionDescriptor descriptor = client->reconnectSession("a+b/c=");

    EXPECT_EQ(captured.method, "GET");
    EXPECT_EQ(captured.target, "/v3/voice/realtime?token=a%2Bb%2Fc%3D");
    EXPECT_EQ(captured.headers["Authorization"], "DeepL-Auth-Key test-key");
    EXPECT_EQ(descriptor.streamingUrl, "wss://voice.deepl.com/r");
    EXPECT_EQ(descriptor.token, "t2");
    EXPECT_TRUE(descriptor.sessionId.empty());
}

TEST_F(VoiceClientTest, MapsHttpStatusToExceptions) {
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(401, "")))
        .WillOnce(Return(jsonResponse(429, "")))
        .WillOnce(Return(jsonResponse(456, "")))
        .WillOnce(Return(jsonResponse(502, "")))
        .WillOnce(Return(jsonResponse(418, "")));

    EXPECT_THROW(client->createSession(defaultRequest()), utils::AuthException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::RateLimitException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::QuotaException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::NetworkException);
    EXPECT_THROW(client->createSession(defaultRequest()), utils::VoiceException);
}

TEST_F(VoiceClientTest, ForbiddenMeansNoVoiceAccess) {
    EXPECT_CALL(*http, send(_)).WillOnce(Return(jsonResponse(403, "")));

    try {
        client->reconnectSession("tok");
        FAIL() << "Expected AccessDeniedException";
    } catch (const utils::AccessDeniedException& e) {
        EXPECT_STREQ(e.what(), "Voice API access denied. Your plan may not include Voice API access.");
    }
}

TEST_F(VoiceClientTest, BadRequestUsesServerMessage) {
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(400, R"({"message":"Unsupported target language"})")))
        .WillOnce(Return(jsonResponse(400, "")));

    try {
        client->createSession(defaultRequest());
        FAIL() << "Expected ValidationException";
    } catch (const utils::ValidationException& e) {
        EXPECT_STREQ(e.what(), "Voice session creation failed: Unsupported target language");
    }

    try {
        client->createSession(defaultRequest());
        FAIL() << "Expected ValidationException";
    } catch (const utils::ValidationException& e) {
        EXPECT_STREQ(e.what(), "Voice session creation failed: Bad request");
    }
}

TEST_F(VoiceClientTest, TransportFailurePropagates) {
    EXPECT_CALL(*http, send(_)).WillOnce(::testing::Throw(utils::NetworkException("Could not resolve")));

    EXPECT_THROW(client->createSession(defaultRequest()), utils::NetworkException);
}

TEST_F(VoiceClientTest, RejectsDisallowedStreamingUrls) {
    const std::vector<std::string> rejected = {
        "not a url",
        "ws://voice.deepl.com/stream",
        "https://voice.deepl.com/stream",
        "wss://evil.example.com/stream",
        "wss://deepl.com.evil.net/stream",
        "wss://notdeepl.com/stream",
    };

    for (const auto& url : rejected) {
        EXPECT_THROW(client->openConnection(url, "tok", {}), utils::VoiceException) << url;
    }
    EXPECT_EQ(factory->connectionCount(), 0u);
}

TEST_F(VoiceClientTest, AcceptsDomainAndSubdomainsCaseInsensitively) {
    client->openConnection("wss://deepl.com/a", "t", {});
    client->openConnection("wss://Voice.API.DeepL.com/b?region=eu", "t=1&x", {});

    ASSERT_EQ(factory->connectionCount(), 2u);
    EXPECT_EQ(factory->connection(0)->url(), "wss://deepl.com/a?token=t");
    EXPECT_EQ(factory->connection(1)->url(), "wss://Voice.API.DeepL.com/b?region=eu&token=t%3D1%26x");
}

TEST_F(VoiceClientTest, DispatchesFramesToHandlers) {
    int sourceUpdates = 0;
    std::string endedTarget;
    bool endOfStream = false;
    transport::ServerError serverError;

    transport::ConnectionHandlers handlers;
    handlers.onSourceTranscript = [&](const transport::TranscriptUpdate&) { ++sourceUpdates; };
    handlers.onEndOfTargetTranscript = [&](const std::string& language) { endedTarget = language; };
    handlers.onEndOfStream = [&]() { endOfStream = true; };
    handlers.onError = [&](const transport::ServerError& error) { serverError = error; };

    auto connection = openedConnection(handlers);
    connection->simulateText(R"({"source_transcript_update":{"concluded":[],"tentative":[]}})");
    connection->simulateText("garbage");
    connection->simulateText(R"({"end_of_target_transcript":{"language":"de"}})");
    connection->simulateText(R"({"target_transcript_update":{"language":"de","concluded":[],"tentative":[]}})");
    connection->simulateText(R"({"error":{"error_code":500,"error_message":"internal"}})");
    connection->simulateText(R"({"end_of_stream":{}})");

    EXPECT_EQ(sourceUpdates, 1);
    EXPECT_EQ(endedTarget, "de");
    EXPECT_EQ(serverError.errorCode, 500);
    EXPECT_EQ(serverError.message, "internal");
    EXPECT_TRUE(endOfStream);
}

TEST_F(VoiceClientTest, ReportsConnectionErrorsAndClosure) {
    std::string connectionError;
    int closeCode = 0;

    transport::ConnectionHandlers handlers;
    handlers.onConnectionError = [&](const std::string& message) { connectionError = message; };
    handlers.onClose = [&](int code, const std::string&) { closeCode = code; };

    auto connection = openedConnection(handlers);
    connection->simulateError("read: connection reset");

    EXPECT_EQ(connectionError, "read: connection reset");
    EXPECT_EQ(closeCode, 1006);
}

TEST_F(VoiceClientTest, SendAudioChunkWritesBase64Frame) {
    auto connection = openedConnection();

    std::vector<uint8_t> audio = {'f', 'o', 'o'};
    EXPECT_TRUE(client->sendAudioChunk(*connection, audio));

    auto frames = connection->sentFrames();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], R"({"source_media_chunk":{"data":"Zm9v"}})");
}

TEST_F(VoiceClientTest, SendAudioChunkSignalsHighWaterMark) {
    auto connection = openedConnection();
    std::vector<uint8_t> audio(10, 0);

    connection->setBufferedAmount(999);
    EXPECT_TRUE(client->sendAudioChunk(*connection, audio));
    EXPECT_TRUE(client->hasSendCapacity(*connection));

    connection->setBufferedAmount(1000);
    EXPECT_FALSE(client->sendAudioChunk(*connection, audio));
    EXPECT_FALSE(client->hasSendCapacity(*connection));

    // Still sent; the return value is only a back-off signal
    EXPECT_EQ(connection->sentFrames().size(), 2u);
}

TEST_F(VoiceClientTest, NothingIsSentOnClosedConnection) {
    auto connection = openedConnection();
    connection->close();

    std::vector<uint8_t> audio(4, 1);
    client->sendAudioChunk(*connection, audio);
    client->sendEndOfSource(*connection);

    EXPECT_TRUE(connection->sentFrames().empty());
}

TEST_F(VoiceClientTest, SendEndOfSourceFrame) {
    auto connection = openedConnection();
    client->sendEndOfSource(*connection);

    auto frames = connection->sentFrames();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], R"({"end_of_source_media":{}})");
}

TEST_F(VoiceClientTest, RetriesServiceUnavailable) {
    auto retrying = makeClient(3);
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(503, "")))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "t1", "sid-1"))));

    transport::SessionDescriptor descriptor = retrying->createSession(defaultRequest());

    EXPECT_EQ(descriptor.sessionId, "sid-1");
}

TEST_F(VoiceClientTest, RetriesTransportFailure) {
    auto retrying = makeClient(3);
    EXPECT_CALL(*http, send(_))
        .WillOnce(::testing::Throw(utils::NetworkException("Connect to api.deepl.com failed")))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/r", "t2"))));

    EXPECT_EQ(retrying->reconnectSession("t1").token, "t2");
}

TEST_F(VoiceClientTest, RateLimitWaitsForRetryAfter) {
    // Backoff alone would wait five seconds
    auto retrying = makeClient(3, std::chrono::milliseconds(5000));

    transport::HttpResponse limited = jsonResponse(429, "");
    limited.headers["retry-after"] = "0";
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(limited))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "t1", "sid-1"))));

    auto start = std::chrono::steady_clock::now();
    retrying->createSession(defaultRequest());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST_F(VoiceClientTest, RateLimitWithoutRetryAfterBacksOff) {
    auto retrying = makeClient(3);
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(429, "")))
        .WillOnce(Return(jsonResponse(429, "")))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "t1", "sid-1"))));

    EXPECT_NO_THROW(retrying->createSession(defaultRequest()));
}

TEST_F(VoiceClientTest, ClientErrorsAreNotRetried) {
    auto retrying = makeClient(3);
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(400, "")))
        .WillOnce(Return(jsonResponse(401, "")))
        .WillOnce(Return(jsonResponse(403, "")))
        .WillOnce(Return(jsonResponse(456, "")));

    EXPECT_THROW(retrying->createSession(defaultRequest()), utils::ValidationException);
    EXPECT_THROW(retrying->createSession(defaultRequest()), utils::AuthException);
    EXPECT_THROW(retrying->reconnectSession("t1"), utils::AccessDeniedException);
    EXPECT_THROW(retrying->createSession(defaultRequest()), utils::QuotaException);
}

TEST_F(VoiceClientTest, GivesUpAfterMaxRetries) {
    auto retrying = makeClient(2);
    EXPECT_CALL(*http, send(_))
        .Times(3)
        .WillRepeatedly(Return(jsonResponse(503, "")));

    try {
        retrying->reconnectSession("t1");
        FAIL() << "Expected NetworkException";
    } catch (const utils::NetworkException& e) {
        EXPECT_STREQ(e.what(), "Service temporarily unavailable: Please try again later");
    }
}

TEST_F(VoiceClientTest, GivesUpOnPersistentTransportFailure) {
    auto retrying = makeClient(1);
    EXPECT_CALL(*http, send(_))
        .Times(2)
        .WillRepeatedly(::testing::Throw(utils::NetworkException("Could not resolve api.deepl.com")));

    EXPECT_THROW(retrying->createSession(defaultRequest()), utils::NetworkException);
}

TEST_F(VoiceClientTest, BackoffDoublesUpToMaximum) {
    transport::VoiceClientOptions options;
    options.apiKey = "test-key";
    transport::VoiceClient defaults(options, http, factory);

    EXPECT_EQ(defaults.backoffDelay(0), std::chrono::milliseconds(1000));
    EXPECT_EQ(defaults.backoffDelay(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(defaults.backoffDelay(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(defaults.backoffDelay(3), std::chrono::milliseconds(8000));
    EXPECT_EQ(defaults.backoffDelay(4), std::chrono::milliseconds(10000));
    EXPECT_EQ(defaults.backoffDelay(20), std::chrono::milliseconds(10000));
}

TEST_F(VoiceClientTest, ParseRetryAfterSeconds) {
    std::chrono::milliseconds delay{0};

    EXPECT_TRUE(transport::VoiceClient::parseRetryAfter("5", delay));
    EXPECT_EQ(delay, std::chrono::milliseconds(5000));
    EXPECT_TRUE(transport::VoiceClient::parseRetryAfter("120", delay));
    EXPECT_EQ(delay, std::chrono::milliseconds(60000));
    EXPECT_TRUE(transport::VoiceClient::parseRetryAfter("-3", delay));
    EXPECT_EQ(delay, std::chrono::milliseconds(0));

    EXPECT_FALSE(transport::VoiceClient::parseRetryAfter("", delay));
    EXPECT_FALSE(transport::VoiceClient::parseRetryAfter("soon", delay));
    EXPECT_FALSE(transport::VoiceClient::parseRetryAfter("5s", delay));
}
