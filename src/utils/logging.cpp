#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace voicestream {
namespace utils {

std::atomic<int> Logger::level_{static_cast<int>(Logger::Level::INFO)};
std::atomic<bool> Logger::initialized_{false};
std::mutex Logger::output_mutex_;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

void Logger::initialize(Level level) {
    setLevel(level);
    if (!initialized_.exchange(true)) {
        debug("Logger initialized");
    }
}

void Logger::setLevel(Level level) {
    level_ = static_cast<int>(level);
}

Logger::Level Logger::getLevel() {
    return static_cast<Level>(level_.load());
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = Level::DEBUG;
    } else if (lower == "info") {
        level = Level::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = Level::WARN;
    } else if (lower == "error") {
        level = Level::ERROR;
    } else {
        return false;
    }
    return true;
}

void Logger::info(const std::string& message) {
    write(Level::INFO, "INFO", message);
}

void Logger::warn(const std::string& message) {
    write(Level::WARN, "WARN", message);
}

void Logger::error(const std::string& message) {
    write(Level::ERROR, "ERROR", message);
}

void Logger::debug(const std::string& message) {
    write(Level::DEBUG, "DEBUG", message);
}

void Logger::write(Level level, const char* tag, const std::string& message) {
    if (static_cast<int>(level) < level_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::ostream& out = (level >= Level::WARN) ? std::cerr : std::cout;
    out << timestamp() << " [" << tag << "] " << message << std::endl;
}

} // namespace utils
} // namespace voicestream
