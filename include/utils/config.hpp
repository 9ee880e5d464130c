#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace voicestream {
namespace utils {

/**
 * Client configuration: service endpoints, credentials and the defaults
 * applied to every voice stream.
 */
struct VoiceConfig {
    // Service
    std::string apiKey;
    std::string baseUrl = "https://api.deepl.com";
    std::string streamingDomain = "deepl.com";
    int requestTimeoutMs = 30000;
    int maxRetries = 3;
    size_t sendHighWaterMarkBytes = 1024 * 1024;

    // Logging
    std::string logLevel = "INFO";

    // Stream defaults
    std::vector<std::string> targetLanguages;
    std::string sourceLanguage;
    std::string formality;
    std::string glossaryId;
    std::string contentType;
    size_t chunkSize = 6400;
    int chunkIntervalMs = 200;
    bool reconnect = true;
    int maxReconnectAttempts = 3;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }
};

/**
 * Loads configuration from a JSON file, then applies environment overrides:
 *   DEEPL_API_KEY          api key
 *   VOICESTREAM_BASE_URL   REST base URL
 *   VOICESTREAM_LOG_LEVEL  log level
 */
class VoiceConfigManager {
public:
    VoiceConfigManager() = default;

    /**
     * Load from file. A missing or empty file yields the defaults.
     * Throws ConfigException when the file cannot be read, parsed or validated.
     */
    void loadFromFile(const std::string& configPath);

    /**
     * Load from a JSON document. Throws ConfigException on parse or
     * validation errors; the previous configuration is kept in that case.
     */
    void loadFromJson(const std::string& json);

    void applyEnvironment();

    VoiceConfig getConfig() const;
    void setConfig(const VoiceConfig& config);

    static ConfigValidationResult validateConfig(const VoiceConfig& config);
    static std::string configToJson(const VoiceConfig& config);

private:
    static VoiceConfig parseJsonConfig(const std::string& json);
    void commit(const VoiceConfig& config, const std::string& source);

    VoiceConfig config_;
    std::string configFilePath_;
    mutable std::mutex configMutex_;
};

} // namespace utils
} // namespace voicestream
