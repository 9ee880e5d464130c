#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdio>
#include <fstream>
#include <future>
#include <sstream>
#include "core/voice_service.hpp"
#include "fixtures/fake_voice_transport.hpp"
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

class VoiceServiceFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<MockHttpTransport>();
        factory = std::make_shared<FakeConnectionFactory>();

        transport::VoiceClientOptions clientOptions;
        clientOptions.apiKey = "flow-key";
        service = std::make_unique<core::VoiceService>(
            std::make_shared<transport::VoiceClient>(clientOptions, http, factory));

        options.targetLanguages = {"ja"};
        options.chunkSize = 16;
        options.chunkInterval = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        if (!tempFile.empty()) {
            std::remove(tempFile.c_str());
        }
    }

    void answerEveryConnection() {
        factory->setConnectHook([](FakeConnection& connection, size_t) {
            FakeConnection* raw = &connection;
            connection.setSendHook([raw](const std::string& frame) {
                if (frame.find("end_of_source_media") == std::string::npos) {
                    return;
                }
                raw->simulateText(R"({"source_transcript_update":{"concluded":[{"text":"Good morning","language":"en"}],"tentative":[]}})");
                raw->simulateText(R"({"target_transcript_update":{"language":"ja","concluded":[{"text":"おはよう"}],"tentative":[]}})");
                raw->simulateText(R"({"end_of_stream":{}})");
            });
            connection.simulateOpen();
        });
    }

    std::string writeTempFile(const std::string& name, size_t bytes) {
        tempFile = ::testing::TempDir() + name;
        std::ofstream out(tempFile, std::ios::binary);
        out << std::string(bytes, '\x01');
        return tempFile;
    }

    std::shared_ptr<MockHttpTransport> http;
    std::shared_ptr<FakeConnectionFactory> factory;
    std::unique_ptr<core::VoiceService> service;
    core::StreamOptions options;
    std::string tempFile;
};

TEST_F(VoiceServiceFlowTest, TranslateStreamEndToEnd) {
    transport::HttpRequest createRequest;
    EXPECT_CALL(*http, send(_))
        .WillOnce(::testing::DoAll(
            ::testing::SaveArg<0>(&createRequest),
            Return(jsonResponse(200, sessionJson("wss://api.deepl.com/v3/voice/realtime/connect", "tok", "sid-42")))));
    answerEveryConnection();

    options.contentType = "audio/pcm;encoding=s16le;rate=16000";
    std::istringstream input(std::string(40, '\x02'));

    core::SessionResult result = service->translateStream(input, options);

    EXPECT_EQ(createRequest.method, "POST");
    utils::JsonValue body = utils::JsonParser::parse(createRequest.body);
    EXPECT_EQ(body.getString("source_media_content_type"), "audio/pcm;encoding=s16le;rate=16000");
    ASSERT_EQ(body.getProperty("target_languages").asArray().size(), 1u);

    EXPECT_EQ(result.sessionId, "sid-42");
    EXPECT_EQ(result.source.language, "en");
    EXPECT_EQ(result.source.text, "Good morning");
    ASSERT_EQ(result.targets.size(), 1u);
    EXPECT_EQ(result.targets[0].language, "ja");
    EXPECT_EQ(result.targets[0].text, "おはよう");

    auto connection = factory->connection(0);
    EXPECT_EQ(connection->url(), "wss://api.deepl.com/v3/voice/realtime/connect?token=tok");
    EXPECT_EQ(connection->countFrames("source_media_chunk"), 3u);
    EXPECT_EQ(connection->countFrames("end_of_source_media"), 1u);
}

TEST_F(VoiceServiceFlowTest, TranslateFileDetectsContentType) {
    transport::HttpRequest createRequest;
    EXPECT_CALL(*http, send(_))
        .WillOnce(::testing::DoAll(
            ::testing::SaveArg<0>(&createRequest),
            Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "tok", "sid-7")))));
    answerEveryConnection();

    std::string path = writeTempFile("voicestream_flow_test.flac", 32);
    core::SessionResult result = service->translateFile(path, options);

    utils::JsonValue body = utils::JsonParser::parse(createRequest.body);
    EXPECT_EQ(body.getString("source_media_content_type"), "audio/flac");
    EXPECT_EQ(result.sessionId, "sid-7");
    EXPECT_EQ(factory->connection(0)->countFrames("source_media_chunk"), 2u);
}

TEST_F(VoiceServiceFlowTest, SessionCreationFailureOpensNoConnection) {
    EXPECT_CALL(*http, send(_)).WillOnce(Return(jsonResponse(456, "")));

    options.contentType = "audio/mpeg";
    test::CountingChunkSource source(3, 16);

    EXPECT_THROW(service->translate(source, options), utils::QuotaException);
    EXPECT_EQ(factory->connectionCount(), 0u);
    EXPECT_EQ(source.produced(), 0u);
    EXPECT_NO_THROW(service->cancel());
}

TEST_F(VoiceServiceFlowTest, CancelFinishesRunningTranslation) {
    EXPECT_CALL(*http, send(_))
        .WillOnce(Return(jsonResponse(200, sessionJson("wss://voice.deepl.com/s", "tok", "sid-9"))));
    answerEveryConnection();

    options.contentType = "audio/opus;container=ogg";
    test::BlockingChunkSource source;
    auto running = std::async(std::launch::async, [&]() { return service->translate(source, options); });

    ASSERT_TRUE(source.waitUntilBlocked());
    service->cancel();

    ASSERT_TRUE(factory->waitForConnections(1));
    ASSERT_TRUE(factory->connection(0)->waitForFrames("end_of_source_media", 1));
    source.release();

    core::SessionResult result = running.get();
    EXPECT_EQ(result.sessionId, "sid-9");
    EXPECT_EQ(result.targets[0].text, "おはよう");
    EXPECT_EQ(factory->connection(0)->countFrames("end_of_source_media"), 1u);
}
