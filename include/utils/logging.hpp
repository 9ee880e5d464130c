#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace voicestream {
namespace utils {

class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3
    };

    static void initialize(Level level = Level::INFO);
    static void setLevel(Level level);
    static Level getLevel();

    /**
     * Parse a level name ("debug", "INFO", "warn", "warning", "error").
     * Returns false and leaves level untouched for unknown names.
     */
    static bool parseLevel(const std::string& name, Level& level);

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

private:
    static void write(Level level, const char* tag, const std::string& message);

    static std::atomic<int> level_;
    static std::atomic<bool> initialized_;
    static std::mutex output_mutex_;
};

} // namespace utils
} // namespace voicestream
