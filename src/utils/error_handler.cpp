#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <random>
#include <sstream>

namespace voicestream {
namespace utils {

namespace {

constexpr int kExitAuth = 2;
constexpr int kExitRateLimit = 3;
constexpr int kExitQuota = 4;
constexpr int kExitNetwork = 5;
constexpr int kExitValidation = 6;
constexpr int kExitConfig = 7;
constexpr int kExitVoice = 9;

const char* kVoicePlanSuggestion =
    "The Voice API requires a DeepL Pro or Enterprise plan. Visit https://www.deepl.com/pro to upgrade.";

} // namespace

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUTHENTICATION: return "authentication";
        case ErrorCategory::ACCESS_DENIED: return "access_denied";
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::RATE_LIMIT: return "rate_limit";
        case ErrorCategory::QUOTA: return "quota";
        case ErrorCategory::NETWORK: return "network";
        case ErrorCategory::CONFIGURATION: return "configuration";
        case ErrorCategory::VOICE: return "voice";
        case ErrorCategory::PROTOCOL: return "protocol";
        case ErrorCategory::UNKNOWN: return "unknown";
    }
    return "unknown";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

VoiceStreamException::VoiceStreamException(const ErrorInfo& error_info, int exit_code,
                                           std::string suggestion)
    : error_info_(error_info), exit_code_(exit_code), suggestion_(std::move(suggestion)) {
}

const char* VoiceStreamException::what() const noexcept {
    return error_info_.message.c_str();
}

AuthException::AuthException(const std::string& message)
    : VoiceStreamException(ErrorInfo(ErrorCategory::AUTHENTICATION, ErrorSeverity::ERROR,
                                     message, "", "Auth"),
                           kExitAuth, "Check the API key (DEEPL_API_KEY or the config file).") {
}

RateLimitException::RateLimitException(const std::string& message)
    : VoiceStreamException(ErrorInfo(ErrorCategory::RATE_LIMIT, ErrorSeverity::WARNING,
                                     message, "", "RateLimit"),
                           kExitRateLimit, "Wait a moment and retry.") {
}

QuotaException::QuotaException(const std::string& message)
    : VoiceStreamException(ErrorInfo(ErrorCategory::QUOTA, ErrorSeverity::ERROR,
                                     message, "", "Quota"),
                           kExitQuota, "Check your usage limits, or upgrade your plan at https://www.deepl.com/pro") {
}

NetworkException::NetworkException(const std::string& message, const std::string& details)
    : VoiceStreamException(ErrorInfo(ErrorCategory::NETWORK, ErrorSeverity::ERROR,
                                     message, details, "Network"),
                           kExitNetwork, "Check your internet connection and proxy settings.") {
}

ValidationException::ValidationException(const std::string& message)
    : VoiceStreamException(ErrorInfo(ErrorCategory::VALIDATION, ErrorSeverity::ERROR,
                                     message, "", "Validation"),
                           kExitValidation) {
}

ConfigException::ConfigException(const std::string& message, const std::string& config_path)
    : VoiceStreamException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                     message, config_path, "Configuration"),
                           kExitConfig) {
}

VoiceException::VoiceException(const std::string& message, const std::string& session_id)
    : VoiceException(ErrorCategory::VOICE, message, "", session_id) {
}

VoiceException::VoiceException(ErrorCategory category, const std::string& message,
                               const std::string& details, const std::string& session_id)
    : VoiceStreamException(ErrorInfo(category, ErrorSeverity::ERROR, message, details,
                                     "Voice", session_id),
                           kExitVoice, kVoicePlanSuggestion) {
}

AccessDeniedException::AccessDeniedException(const std::string& message)
    : VoiceException(ErrorCategory::ACCESS_DENIED, message, "", "") {
}

ProtocolException::ProtocolException(const std::string& message, const std::string& request_type,
                                     int error_code, int reason_code, const std::string& session_id)
    : VoiceException(ErrorCategory::PROTOCOL, message,
                     "request_type=" + request_type + " error_code=" + std::to_string(error_code) +
                         " reason_code=" + std::to_string(reason_code),
                     session_id),
      request_type_(request_type), error_code_(error_code), reason_code_(reason_code) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        error_counts_[error.category]++;
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    if (auto* typed = dynamic_cast<const VoiceStreamException*>(&e)) {
        ErrorInfo info = typed->getErrorInfo();
        if (!context.empty()) {
            info.context = context;
        }
        if (info.session_id.empty()) {
            info.session_id = session_id;
        }
        reportError(info);
        return;
    }

    reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "",
                          context, session_id));
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(category);
    return it != error_counts_.end() ? it->second : 0;
}

size_t ErrorHandler::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : error_counts_) {
        total += entry.second;
    }
    return total;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = error_history_.size() > count ? error_history_.size() - count : 0;
    return std::vector<ErrorInfo>(error_history_.begin() + static_cast<std::ptrdiff_t>(start),
                                  error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
    error_counts_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::string line = "[" + error.id + "] " + categoryToString(error.category) + ": " + error.message;
    if (!error.details.empty()) {
        line += " (" + error.details + ")";
    }
    if (!error.session_id.empty()) {
        line += " session=" + error.session_id;
    }

    if (error.severity == ErrorSeverity::INFO) {
        Logger::info(line);
    } else if (error.severity == ErrorSeverity::WARNING) {
        Logger::warn(line);
    } else {
        Logger::error(line);
    }
}

} // namespace utils
} // namespace voicestream
