#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace forge {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * Process-wide log settings. Tests redirect the stream to capture output.
 */
struct LogSettings {
    std::atomic<LogLevel> min_level{LogLevel::Info};
    std::ostream* stream = &std::cout;
    std::mutex mutex;

    static LogSettings& instance() {
        static LogSettings settings;
        return settings;
    }
};

inline void set_log_level(LogLevel level) { LogSettings::instance().min_level = level; }

inline void set_log_stream(std::ostream* stream) {
    auto& settings = LogSettings::instance();
    std::lock_guard<std::mutex> lock(settings.mutex);
    settings.stream = stream ? stream : &std::cout;
}

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline void log(LogLevel level, const std::string& domain, const std::string& message,
                const nlohmann::json& fields = {}) {
    auto& settings = LogSettings::instance();
    if (level < settings.min_level) return;

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    std::lock_guard<std::mutex> lock(settings.mutex);
    *settings.stream << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, domain, message, fields);
}

}  // namespace forge
