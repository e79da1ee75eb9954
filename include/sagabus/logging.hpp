#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace sagabus {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/**
 * Receives each structured log record that passes the level threshold.
 */
using LogSink = std::function<void(const nlohmann::json&)>;

std::string now_iso8601();

const char* log_level_name(LogLevel level);

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
 * Returns false and leaves `level` untouched for anything else.
 */
bool parse_log_level(const std::string& text, LogLevel& level);

void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Redirect records to `sink`. Passing nullptr restores stdout.
 */
void set_log_sink(LogSink sink);

/**
 * Emit one JSON log line: level, message, component, timestamp and `fields`.
 */
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

}  // namespace sagabus
