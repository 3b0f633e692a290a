#include <gtest/gtest.h>
#include "common/engine_config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <filesystem>
#include <fstream>

using namespace aim;

// ─── Parsing ──────────────────────────────────────────────────

TEST(ConfigTest, DefaultsWhenKeysMissing) {
    EngineConfig config = EngineConfig::fromJsonString("{}");
    EXPECT_EQ(config.workers, 0);
    EXPECT_GE(config.resolvedWorkers(), 1u);
    EXPECT_EQ(config.task_timeout_ms, 60000);
    EXPECT_EQ(config.scheduling, SchedulingPolicy::SPEED_FIRST);
    EXPECT_EQ(config.display_precision, 2);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.registry_path.empty());
    EXPECT_EQ(config.artifact.max_bytes, 20u * 1024u * 1024u);
    EXPECT_TRUE(config.artifact.allowsMimeType("image/png"));
    EXPECT_TRUE(config.artifact.allowsMimeType("image/jpeg"));
    EXPECT_FALSE(config.artifact.allowsMimeType("image/gif"));
    EXPECT_FALSE(config.artifact.crop_width.has_value());
}

TEST(ConfigTest, ParsesAllKeys) {
    EngineConfig config = EngineConfig::fromJsonString(R"({
      "workers": 3,
      "task_timeout_ms": 1500,
      "scheduling": "fifo",
      "display_precision": 4,
      "log_level": "debug",
      "registry": "/etc/aim/metrics.json",
      "unknown_key": true,
      "artifact": {
        "max_bytes": 1000,
        "min_width": 2, "min_height": 3,
        "max_width": 800, "max_height": 600,
        "allowed_mime_types": ["image/png"],
        "crop_width": 1280, "crop_height": 800
      }
    })");
    EXPECT_EQ(config.resolvedWorkers(), 3u);
    EXPECT_EQ(config.task_timeout_ms, 1500);
    EXPECT_EQ(config.scheduling, SchedulingPolicy::FIFO);
    EXPECT_EQ(config.display_precision, 4);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.registry_path, "/etc/aim/metrics.json");
    EXPECT_EQ(config.artifact.max_bytes, 1000u);
    EXPECT_EQ(config.artifact.min_height, 3);
    EXPECT_EQ(config.artifact.max_width, 800);
    EXPECT_FALSE(config.artifact.allowsMimeType("image/jpeg"));
    EXPECT_EQ(config.artifact.crop_width, 1280);
    EXPECT_EQ(config.artifact.crop_height, 800);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(EngineConfig::fromJsonString("{oops"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString("[]"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"workers": -1})"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"workers": "four"})"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"task_timeout_ms": 0})"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"scheduling": "random"})"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"artifact": {"max_bytes": 0}})"), ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"artifact": {"crop_width": 100}})"),
                 ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(
                     R"({"artifact": {"min_width": 100, "max_width": 50}})"),
                 ConfigError);
    EXPECT_THROW(EngineConfig::fromJsonString(R"({"artifact": {"allowed_mime_types": []}})"),
                 ConfigError);
}

TEST(ConfigTest, SchedulingPolicyNames) {
    EXPECT_STREQ(toString(SchedulingPolicy::SPEED_FIRST), "speed_first");
    EXPECT_STREQ(toString(SchedulingPolicy::FIFO), "fifo");
}

// ─── Files ────────────────────────────────────────────────────

TEST(ConfigTest, RegistryPathIsRelativeToConfigFile) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "aim_config_test";
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "engine.json");
        out << R"({"registry": "metrics.json", "workers": 2})";
    }

    EngineConfig config = EngineConfig::loadFromFile((dir / "engine.json").string());
    EXPECT_EQ(fs::path(config.registry_path), (dir / "metrics.json").lexically_normal());
    EXPECT_EQ(config.workers, 2);

    fs::remove_all(dir);
}

TEST(ConfigTest, ShippedConfigLoads) {
    EngineConfig config = EngineConfig::loadFromFile(AIM_SOURCE_DIR "/config/engine.json");
    EXPECT_EQ(config.scheduling, SchedulingPolicy::SPEED_FIRST);
    EXPECT_TRUE(std::filesystem::exists(config.registry_path));
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(EngineConfig::loadFromFile("/nonexistent/engine.json"), ConfigError);
}

// ─── Logging ──────────────────────────────────────────────────

TEST(LoggingTest, SharedLoggerAndLevels) {
    auto log = logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log, logger());
    EXPECT_EQ(log->name(), "aim");

    setLogLevel("debug");
    EXPECT_EQ(log->level(), spdlog::level::debug);
    setLogLevel("warn");
    EXPECT_EQ(log->level(), spdlog::level::warn);
    EXPECT_THROW(setLogLevel("chatty"), ConfigError);
    setLogLevel("info");
}
