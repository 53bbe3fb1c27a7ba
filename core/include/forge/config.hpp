#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "forge/logging.hpp"

namespace forge {

/**
 * Runtime settings for the engine server.
 */
struct EngineConfig {
    int port = 50601;
    LogLevel log_level = LogLevel::Info;
    int64_t gl_drain_interval_ms = 1000;
    uint32_t default_lead_time_days = 14;
    std::string actor = "forge-engine";
    /// Master data and opening stock loaded at startup; empty for none.
    std::string seed_path;
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * Defaults, then the JSON file named by FORGE_CONFIG, then environment
 * overrides (PORT, FORGE_LOG_LEVEL, FORGE_GL_DRAIN_INTERVAL_MS,
 * FORGE_DEFAULT_LEAD_TIME_DAYS, FORGE_SEED). Throws InvalidArgumentError on bad values.
 */
EngineConfig load_config(const EnvLookup& env = nullptr);

/**
 * Apply the keys present in a JSON document to config.
 */
void apply_config_json(EngineConfig& config, const std::string& json_text);

LogLevel parse_log_level(const std::string& text);

} // namespace forge
