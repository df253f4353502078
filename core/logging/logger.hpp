#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace minder {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Logger writes timestamped lines to stderr. Supervisor and worker share the
// same stderr, so every line carries a per-process tag.
class Logger {
public:
    static void init(Level threshold, const std::string& tag);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Tag printed in front of every line, e.g. "minder" or "worker:echo"
    static void set_tag(const std::string& tag);

private:
    static std::atomic<Level> threshold_;
    static std::string tag_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string& level_str);

// Lower-case name of a level ("debug", "info", ...)
std::string level_to_string(Level level);

// True if level_str names a known level (case-insensitive)
bool is_valid_level(const std::string& level_str);

} // namespace logging
} // namespace minder

// Macro macros to handle string building
#define LOG_INTERNAL(level, msg) \
    do { \
        std::stringstream ss; \
        ss << msg; \
        minder::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(minder::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(minder::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(minder::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(minder::logging::Level::LVL_ERROR, msg)
