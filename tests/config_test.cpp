#include <gtest/gtest.h>
#include <map>
#include <string>
#include "forge/config.hpp"
#include "forge/errors.hpp"

using namespace forge;

class ConfigTest : public ::testing::Test {
protected:
    EnvLookup lookup() {
        return [this](const char* name) -> const char* {
            auto it = env_.find(name);
            return it != env_.end() ? it->second.c_str() : nullptr;
        };
    }

    std::map<std::string, std::string> env_;
};

TEST_F(ConfigTest, LoadConfig_WithEmptyEnvironment_ShouldUseDefaults) {
    auto config = load_config(lookup());

    EXPECT_EQ(config.port, 50601);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.gl_drain_interval_ms, 1000);
    EXPECT_EQ(config.default_lead_time_days, 14u);
}

TEST_F(ConfigTest, LoadConfig_WithOverrides_ShouldApplyThem) {
    // Given
    env_["PORT"] = "6000";
    env_["FORGE_LOG_LEVEL"] = "debug";
    env_["FORGE_DEFAULT_LEAD_TIME_DAYS"] = "21";

    // When
    auto config = load_config(lookup());

    // Then
    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.default_lead_time_days, 21u);
}

TEST_F(ConfigTest, LoadConfig_WithBadPort_ShouldThrow) {
    env_["PORT"] = "not-a-port";
    EXPECT_THROW(load_config(lookup()), InvalidArgumentError);

    env_["PORT"] = "70000";
    EXPECT_THROW(load_config(lookup()), InvalidArgumentError);
}

TEST_F(ConfigTest, LoadConfig_WithMissingFile_ShouldThrow) {
    env_["FORGE_CONFIG"] = "/nonexistent/forge.json";
    EXPECT_THROW(load_config(lookup()), InvalidArgumentError);
}

TEST_F(ConfigTest, ApplyConfigJson_ShouldOverridePresentKeysOnly) {
    EngineConfig config;
    apply_config_json(config, R"({"port": 7000, "actor": "planner"})");

    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.actor, "planner");
    EXPECT_EQ(config.gl_drain_interval_ms, 1000);
}

TEST_F(ConfigTest, ApplyConfigJson_WithWrongType_ShouldThrow) {
    EngineConfig config;
    EXPECT_THROW(apply_config_json(config, R"({"port": "abc"})"), InvalidArgumentError);
    EXPECT_THROW(apply_config_json(config, "[1, 2]"), InvalidArgumentError);
    EXPECT_THROW(apply_config_json(config, "{"), InvalidArgumentError);
}

TEST_F(ConfigTest, ParseLogLevel_WithUnknownLevel_ShouldThrow) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_THROW(parse_log_level("verbose"), InvalidArgumentError);
}

TEST_F(ConfigTest, LoadConfig_WithSeed_ShouldPreferEnvironment) {
    // Given
    EngineConfig config;
    apply_config_json(config, R"({"seed_path": "/etc/forge/seed.json"})");
    env_["FORGE_SEED"] = "/srv/seed.json";

    // When
    auto loaded = load_config(lookup());

    // Then
    EXPECT_EQ(config.seed_path, "/etc/forge/seed.json");
    EXPECT_EQ(loaded.seed_path, "/srv/seed.json");
    EXPECT_TRUE(load_config([](const char*) -> const char* { return nullptr; }).seed_path.empty());
}
