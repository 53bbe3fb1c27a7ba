#include "forge/config.hpp"
#include "forge/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace forge {

namespace {

int64_t parse_integer(const std::string& name, const std::string& text, int64_t min, int64_t max) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < min || value > max) {
            throw InvalidArgumentError(name + " out of range: " + text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw InvalidArgumentError(name + " is not an integer: " + text);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError(name + " out of range: " + text);
    }
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    throw InvalidArgumentError("Unknown log level: " + text);
}

void apply_config_json(EngineConfig& config, const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError(std::string("Malformed config: ") + e.what());
    }
    if (!doc.is_object()) throw InvalidArgumentError("Config must be a JSON object");

    try {
        if (doc.contains("port")) {
            config.port = static_cast<int>(
                parse_integer("port", std::to_string(doc.at("port").get<int64_t>()), 1, 65535));
        }
        if (doc.contains("log_level")) {
            config.log_level = parse_log_level(doc.at("log_level").get<std::string>());
        }
        if (doc.contains("gl_drain_interval_ms")) {
            config.gl_drain_interval_ms = doc.at("gl_drain_interval_ms").get<int64_t>();
            if (config.gl_drain_interval_ms <= 0) {
                throw InvalidArgumentError("gl_drain_interval_ms must be positive");
            }
        }
        if (doc.contains("default_lead_time_days")) {
            config.default_lead_time_days = doc.at("default_lead_time_days").get<uint32_t>();
        }
        if (doc.contains("actor")) {
            config.actor = doc.at("actor").get<std::string>();
        }
        if (doc.contains("seed_path")) {
            config.seed_path = doc.at("seed_path").get<std::string>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidArgumentError(std::string("Config value has wrong type: ") + e.what());
    }
}

EngineConfig load_config(const EnvLookup& env) {
    EnvLookup lookup = env;
    if (!lookup) lookup = [](const char* name) -> const char* { return std::getenv(name); };
    EngineConfig config;

    if (const char* path = lookup("FORGE_CONFIG")) {
        std::ifstream file(path);
        if (!file) throw InvalidArgumentError(std::string("Cannot open config file: ") + path);
        std::stringstream contents;
        contents << file.rdbuf();
        apply_config_json(config, contents.str());
    }

    if (const char* port = lookup("PORT")) {
        config.port = static_cast<int>(parse_integer("PORT", port, 1, 65535));
    }
    if (const char* level = lookup("FORGE_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* interval = lookup("FORGE_GL_DRAIN_INTERVAL_MS")) {
        config.gl_drain_interval_ms =
            parse_integer("FORGE_GL_DRAIN_INTERVAL_MS", interval, 1, 3600000);
    }
    if (const char* lead_time = lookup("FORGE_DEFAULT_LEAD_TIME_DAYS")) {
        config.default_lead_time_days = static_cast<uint32_t>(
            parse_integer("FORGE_DEFAULT_LEAD_TIME_DAYS", lead_time, 0, 3650));
    }
    if (const char* seed = lookup("FORGE_SEED")) {
        config.seed_path = seed;
    }
    return config;
}

} // namespace forge
