#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace voicestream {
namespace utils {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

void VoiceConfigManager::loadFromFile(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        configFilePath_ = configPath;
    }

    if (!std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
        commit(VoiceConfig(), "defaults");
        return;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    if (json.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::info("Empty configuration file, using defaults");
        commit(VoiceConfig(), "defaults");
        return;
    }

    VoiceConfig config;
    try {
        config = parseJsonConfig(json);
    } catch (const std::runtime_error& e) {
        throw ConfigException("Failed to parse configuration file: " + std::string(e.what()), configPath);
    }
    commit(config, configPath);
}

void VoiceConfigManager::loadFromJson(const std::string& json) {
    VoiceConfig config;
    try {
        config = parseJsonConfig(json);
    } catch (const std::runtime_error& e) {
        throw ConfigException("Failed to parse JSON configuration: " + std::string(e.what()));
    }
    commit(config, "JSON document");
}

void VoiceConfigManager::applyEnvironment() {
    VoiceConfig config = getConfig();

    std::string apiKey = envOrEmpty("DEEPL_API_KEY");
    if (!apiKey.empty()) {
        config.apiKey = apiKey;
    }
    std::string baseUrl = envOrEmpty("VOICESTREAM_BASE_URL");
    if (!baseUrl.empty()) {
        config.baseUrl = baseUrl;
    }
    std::string logLevel = envOrEmpty("VOICESTREAM_LOG_LEVEL");
    if (!logLevel.empty()) {
        config.logLevel = logLevel;
    }

    commit(config, "environment");
}

VoiceConfig VoiceConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void VoiceConfigManager::setConfig(const VoiceConfig& config) {
    commit(config, "caller");
}

void VoiceConfigManager::commit(const VoiceConfig& config, const std::string& source) {
    auto validation = validateConfig(config);
    if (!validation.isValid) {
        std::string joined;
        for (const auto& error : validation.errors) {
            if (!joined.empty()) joined += "; ";
            joined += error;
        }
        throw ConfigException("Invalid configuration from " + source + ": " + joined);
    }

    for (const auto& warning : validation.warnings) {
        Logger::warn("Configuration warning: " + warning);
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
    Logger::debug("Voice configuration loaded from " + source);
}

ConfigValidationResult VoiceConfigManager::validateConfig(const VoiceConfig& config) {
    ConfigValidationResult result;

    if (config.baseUrl.rfind("https://", 0) != 0) {
        result.addError("baseUrl must use https://");
    }
    if (config.streamingDomain.empty()) {
        result.addError("streamingDomain must not be empty");
    }
    if (config.requestTimeoutMs <= 0) {
        result.addError("requestTimeoutMs must be positive");
    }
    if (config.maxRetries < 0) {
        result.addError("maxRetries must not be negative");
    }
    if (config.sendHighWaterMarkBytes == 0) {
        result.addError("highWaterMarkBytes must be positive");
    }
    if (config.chunkSize == 0) {
        result.addError("chunkSize must be positive");
    }
    if (config.chunkIntervalMs < 0) {
        result.addError("chunkIntervalMs must not be negative");
    }
    if (config.maxReconnectAttempts < 0) {
        result.addError("maxReconnectAttempts must not be negative");
    }

    Logger::Level level;
    if (!Logger::parseLevel(config.logLevel, level)) {
        result.addError("Unknown log level: " + config.logLevel);
    }

    if (config.apiKey.empty()) {
        result.addWarning("No API key configured (set DEEPL_API_KEY)");
    }
    if (config.chunkIntervalMs == 0) {
        result.addWarning("chunkIntervalMs is 0, audio is sent faster than real time");
    }

    return result;
}

VoiceConfig VoiceConfigManager::parseJsonConfig(const std::string& json) {
    JsonValue root = JsonParser::parse(json);
    if (!root.isObject()) {
        throw std::runtime_error("Configuration root must be an object");
    }

    VoiceConfig config;

    const JsonValue& api = root.getProperty("api");
    if (api.isObject()) {
        config.apiKey = api.getString("key", config.apiKey);
        config.baseUrl = api.getString("baseUrl", config.baseUrl);
        config.streamingDomain = api.getString("streamingDomain", config.streamingDomain);
        config.requestTimeoutMs = static_cast<int>(api.getNumber("timeoutMs", config.requestTimeoutMs));
        config.maxRetries = static_cast<int>(api.getNumber("maxRetries", config.maxRetries));
    }

    const JsonValue& logging = root.getProperty("logging");
    if (logging.isObject()) {
        config.logLevel = logging.getString("level", config.logLevel);
    }

    const JsonValue& voice = root.getProperty("voice");
    if (voice.isObject()) {
        const JsonValue& targets = voice.getProperty("targetLanguages");
        if (targets.isArray()) {
            for (const auto& lang : targets.asArray()) {
                if (lang.isString()) {
                    config.targetLanguages.push_back(lang.asString());
                }
            }
        }
        config.sourceLanguage = voice.getString("sourceLanguage", config.sourceLanguage);
        config.formality = voice.getString("formality", config.formality);
        config.glossaryId = voice.getString("glossaryId", config.glossaryId);
        config.contentType = voice.getString("contentType", config.contentType);

        double chunkSize = voice.getNumber("chunkSize", static_cast<double>(config.chunkSize));
        config.chunkSize = chunkSize > 0 ? static_cast<size_t>(chunkSize) : 0;
        config.chunkIntervalMs = static_cast<int>(voice.getNumber("chunkIntervalMs", config.chunkIntervalMs));
        config.reconnect = voice.getBool("reconnect", config.reconnect);
        config.maxReconnectAttempts = static_cast<int>(
            voice.getNumber("maxReconnectAttempts", config.maxReconnectAttempts));

        double hwm = voice.getNumber("highWaterMarkBytes", static_cast<double>(config.sendHighWaterMarkBytes));
        config.sendHighWaterMarkBytes = hwm > 0 ? static_cast<size_t>(hwm) : 0;
    }

    return config;
}

std::string VoiceConfigManager::configToJson(const VoiceConfig& config) {
    JsonValue api = JsonValue::object();
    // The key is intentionally not written back.
    api.setObjectProperty("baseUrl", JsonValue(config.baseUrl));
    api.setObjectProperty("streamingDomain", JsonValue(config.streamingDomain));
    api.setObjectProperty("timeoutMs", JsonValue(config.requestTimeoutMs));
    api.setObjectProperty("maxRetries", JsonValue(config.maxRetries));

    JsonValue logging = JsonValue::object();
    logging.setObjectProperty("level", JsonValue(config.logLevel));

    JsonValue targets = JsonValue::array();
    for (const auto& lang : config.targetLanguages) {
        targets.addArrayElement(JsonValue(lang));
    }

    JsonValue voice = JsonValue::object();
    voice.setObjectProperty("targetLanguages", targets);
    voice.setObjectProperty("sourceLanguage", JsonValue(config.sourceLanguage));
    voice.setObjectProperty("formality", JsonValue(config.formality));
    voice.setObjectProperty("glossaryId", JsonValue(config.glossaryId));
    voice.setObjectProperty("contentType", JsonValue(config.contentType));
    voice.setObjectProperty("chunkSize", JsonValue(static_cast<double>(config.chunkSize)));
    voice.setObjectProperty("chunkIntervalMs", JsonValue(config.chunkIntervalMs));
    voice.setObjectProperty("reconnect", JsonValue(config.reconnect));
    voice.setObjectProperty("maxReconnectAttempts", JsonValue(config.maxReconnectAttempts));
    voice.setObjectProperty("highWaterMarkBytes", JsonValue(static_cast<double>(config.sendHighWaterMarkBytes)));

    JsonValue root = JsonValue::object();
    root.setObjectProperty("api", api);
    root.setObjectProperty("logging", logging);
    root.setObjectProperty("voice", voice);
    return JsonParser::stringify(root);
}

} // namespace utils
} // namespace voicestream
