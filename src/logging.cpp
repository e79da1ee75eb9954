#include "sagabus/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sagabus {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogSink g_sink;

}  // namespace

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        level = LogLevel::Debug;
    } else if (lowered == "info") {
        level = LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::Warn;
    } else if (lowered == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) {
    if (static_cast<int>(level) < g_level.load()) {
        return;
    }

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(log_entry);
        return;
    }
    std::cout << log_entry.dump() << std::endl;
}

}  // namespace sagabus
