#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voicestream {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per failure class a caller may want to react to
 */
enum class ErrorCategory {
    AUTHENTICATION,
    ACCESS_DENIED,
    VALIDATION,
    RATE_LIMIT,
    QUOTA,
    NETWORK,
    CONFIGURATION,
    VOICE,
    PROTOCOL,
    UNKNOWN
};

std::string categoryToString(ErrorCategory category);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base class of every exception raised by this library.
 * what() returns the human-readable message only; details and the
 * suggestion are available separately for callers that print them.
 */
class VoiceStreamException : public std::exception {
public:
    VoiceStreamException(const ErrorInfo& error_info, int exit_code, std::string suggestion = "");
    const char* what() const noexcept override;

    const ErrorInfo& getErrorInfo() const { return error_info_; }
    ErrorCategory getCategory() const { return error_info_.category; }
    int getExitCode() const { return exit_code_; }
    const std::string& getSuggestion() const { return suggestion_; }

private:
    ErrorInfo error_info_;
    int exit_code_;
    std::string suggestion_;
};

class AuthException : public VoiceStreamException {
public:
    explicit AuthException(const std::string& message);
};

class RateLimitException : public VoiceStreamException {
public:
    explicit RateLimitException(const std::string& message);
};

class QuotaException : public VoiceStreamException {
public:
    explicit QuotaException(const std::string& message);
};

class NetworkException : public VoiceStreamException {
public:
    NetworkException(const std::string& message, const std::string& details = "");
};

class ValidationException : public VoiceStreamException {
public:
    explicit ValidationException(const std::string& message);
};

class ConfigException : public VoiceStreamException {
public:
    ConfigException(const std::string& message, const std::string& config_path = "");
};

/**
 * Failure of a voice streaming session or of the voice REST endpoints.
 */
class VoiceException : public VoiceStreamException {
public:
    VoiceException(const std::string& message, const std::string& session_id = "");

protected:
    VoiceException(ErrorCategory category, const std::string& message,
                   const std::string& details, const std::string& session_id);
};

class AccessDeniedException : public VoiceException {
public:
    explicit AccessDeniedException(const std::string& message);
};

/**
 * Raised when the server sends an explicit error frame.
 */
class ProtocolException : public VoiceException {
public:
    ProtocolException(const std::string& message, const std::string& request_type,
                      int error_code, int reason_code, const std::string& session_id = "");

    const std::string& getRequestType() const { return request_type_; }
    int getErrorCode() const { return error_code_; }
    int getReasonCode() const { return reason_code_; }

private:
    std::string request_type_;
    int error_code_;
    int reason_code_;
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide sink for fatal errors: logs them, keeps a bounded history
 * and forwards them to an optional callback.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    size_t getErrorCount(ErrorCategory category) const;
    size_t getTotalErrorCount() const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    std::map<ErrorCategory, size_t> error_counts_;
    size_t max_history_size_ = 256;

    mutable std::mutex mutex_;
};

} // namespace utils
} // namespace voicestream
