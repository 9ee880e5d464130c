#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace voicestream::utils;

class VoiceConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testConfigPath = "test_voicestream_config.json";
        unsetenv("DEEPL_API_KEY");
        unsetenv("VOICESTREAM_BASE_URL");
        unsetenv("VOICESTREAM_LOG_LEVEL");
    }

    void TearDown() override {
        std::remove(testConfigPath.c_str());
        unsetenv("DEEPL_API_KEY");
        unsetenv("VOICESTREAM_BASE_URL");
        unsetenv("VOICESTREAM_LOG_LEVEL");
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
    }

    std::string testConfigPath;
    VoiceConfigManager manager;
};

TEST_F(VoiceConfigTest, DefaultConfiguration) {
    VoiceConfig config = manager.getConfig();

    EXPECT_EQ(config.baseUrl, "https://api.deepl.com");
    EXPECT_EQ(config.streamingDomain, "deepl.com");
    EXPECT_EQ(config.chunkSize, 6400u);
    EXPECT_EQ(config.chunkIntervalMs, 200);
    EXPECT_TRUE(config.reconnect);
    EXPECT_EQ(config.maxReconnectAttempts, 3);
    EXPECT_EQ(config.maxRetries, 3);
    EXPECT_EQ(config.sendHighWaterMarkBytes, 1024u * 1024u);
}

TEST_F(VoiceConfigTest, MissingFileYieldsDefaults) {
    EXPECT_NO_THROW(manager.loadFromFile("does/not/exist.json"));
    EXPECT_EQ(manager.getConfig().chunkSize, 6400u);
}

TEST_F(VoiceConfigTest, LoadFromFile) {
    writeConfig(R"({
        "api": {"key": "file-key", "timeoutMs": 5000, "maxRetries": 1},
        "logging": {"level": "debug"},
        "voice": {
            "targetLanguages": ["de", "fr"],
            "sourceLanguage": "en",
            "contentType": "audio/flac",
            "chunkSize": 3200,
            "chunkIntervalMs": 100,
            "reconnect": false,
            "maxReconnectAttempts": 5
        }
    })");

    manager.loadFromFile(testConfigPath);
    VoiceConfig config = manager.getConfig();

    EXPECT_EQ(config.apiKey, "file-key");
    EXPECT_EQ(config.requestTimeoutMs, 5000);
    EXPECT_EQ(config.maxRetries, 1);
    EXPECT_EQ(config.logLevel, "debug");
    ASSERT_EQ(config.targetLanguages.size(), 2u);
    EXPECT_EQ(config.targetLanguages[1], "fr");
    EXPECT_EQ(config.sourceLanguage, "en");
    EXPECT_EQ(config.contentType, "audio/flac");
    EXPECT_EQ(config.chunkSize, 3200u);
    EXPECT_EQ(config.chunkIntervalMs, 100);
    EXPECT_FALSE(config.reconnect);
    EXPECT_EQ(config.maxReconnectAttempts, 5);
}

TEST_F(VoiceConfigTest, MalformedFileThrowsConfigException) {
    writeConfig("{ not json");
    EXPECT_THROW(manager.loadFromFile(testConfigPath), ConfigException);
}

TEST_F(VoiceConfigTest, InvalidValuesAreRejectedAndPreviousConfigKept) {
    manager.loadFromJson(R"({"voice": {"chunkSize": 1000}})");

    EXPECT_THROW(manager.loadFromJson(R"({"api": {"baseUrl": "http://insecure.example"}})"),
                 ConfigException);
    EXPECT_THROW(manager.loadFromJson(R"({"voice": {"maxReconnectAttempts": -1}})"),
                 ConfigException);
    EXPECT_THROW(manager.loadFromJson(R"({"api": {"maxRetries": -1}})"),
                 ConfigException);

    EXPECT_EQ(manager.getConfig().chunkSize, 1000u);
}

TEST_F(VoiceConfigTest, EnvironmentOverridesFile) {
    manager.loadFromJson(R"({"api": {"key": "file-key"}, "logging": {"level": "info"}})");
    setenv("DEEPL_API_KEY", "env-key", 1);
    setenv("VOICESTREAM_LOG_LEVEL", "warn", 1);

    manager.applyEnvironment();

    EXPECT_EQ(manager.getConfig().apiKey, "env-key");
    EXPECT_EQ(manager.getConfig().logLevel, "warn");
}

TEST_F(VoiceConfigTest, ValidationReportsErrorsAndWarnings) {
    VoiceConfig config;
    config.chunkSize = 0;
    config.chunkIntervalMs = 0;
    config.logLevel = "loud";

    ConfigValidationResult result = VoiceConfigManager::validateConfig(config);

    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.warnings.size(), 2u); // no API key, zero interval
}

TEST_F(VoiceConfigTest, SerializedConfigOmitsApiKey) {
    VoiceConfig config;
    config.apiKey = "secret-key";
    config.targetLanguages = {"ja"};

    std::string json = VoiceConfigManager::configToJson(config);
    EXPECT_EQ(json.find("secret-key"), std::string::npos);

    VoiceConfigManager reloaded;
    reloaded.loadFromJson(json);
    ASSERT_EQ(reloaded.getConfig().targetLanguages.size(), 1u);
    EXPECT_EQ(reloaded.getConfig().targetLanguages[0], "ja");
}
