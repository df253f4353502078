#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <algorithm>

namespace minder {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::string Logger::tag_ = "minder";
std::mutex Logger::mutex_;

void Logger::init(Level threshold, const std::string& tag) {
    threshold_ = threshold;
    set_tag(tag);
}

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_.load();
}

void Logger::set_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    tag_ = tag;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (level < threshold_.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    // Build the whole line first so a worker and its supervisor writing to the
    // same stderr do not interleave within a line.
    std::ostringstream out;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    out << " [" << tag_ << "]";

    switch (level) {
        case Level::LVL_DEBUG: out << " [DEBUG] "; break;
        case Level::LVL_INFO:  out << " [INFO]  "; break;
        case Level::LVL_WARN:  out << " [WARN]  "; break;
        case Level::LVL_ERROR: out << " [ERROR] "; break;
        default: break;
    }

    out << message << "\n";
    std::cerr << out.str();

    if (level >= Level::LVL_WARN) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO; // Default
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "debug";
        case Level::LVL_INFO:  return "info";
        case Level::LVL_WARN:  return "warn";
        case Level::LVL_ERROR: return "error";
        case Level::LVL_NONE:  return "none";
        default: return "info";
    }
}

bool is_valid_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s == "DEBUG" || s == "INFO" || s == "WARN" || s == "ERROR" || s == "NONE";
}

} // namespace logging
} // namespace minder
