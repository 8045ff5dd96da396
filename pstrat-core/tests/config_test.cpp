#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "pstrat/core/config.hpp"
#include "pstrat/core/errors.hpp"

using namespace pstrat::core;

TEST(EngineConfig, DefaultsWhenKeysAreMissing) {
    const EngineConfig cfg = engineConfigFromYaml(YAML::Load("{}"));
    const EngineConfig def{};
    EXPECT_EQ(cfg.settingsPath, def.settingsPath);
    EXPECT_EQ(cfg.initQueueCapacity, def.initQueueCapacity);
    EXPECT_EQ(cfg.tradeIdRetention, 0u);
    EXPECT_EQ(cfg.engineType, EngineType::Live);
}

TEST(EngineConfig, ReadsEveryKey) {
    const EngineConfig cfg = engineConfigFromYaml(YAML::Load(R"(
settings_file: s.yaml
data_file: d.yaml
init_queue_capacity: 16
event_queue_capacity: 1024
trade_id_retention: 5000
engine_type: backtesting
log_level: debug
log_dir: /tmp/logs
async_logging: false
)"));
    EXPECT_EQ(cfg.settingsPath, "s.yaml");
    EXPECT_EQ(cfg.dataPath, "d.yaml");
    EXPECT_EQ(cfg.initQueueCapacity, 16u);
    EXPECT_EQ(cfg.eventQueueCapacity, 1024u);
    EXPECT_EQ(cfg.tradeIdRetention, 5000u);
    EXPECT_EQ(cfg.engineType, EngineType::Backtesting);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logDir, "/tmp/logs");
    EXPECT_FALSE(cfg.asyncLogging);
}

TEST(EngineConfig, RejectsInvalidValues) {
    EXPECT_THROW(engineConfigFromYaml(YAML::Load("engine_type: paper")), ConfigError);
    EXPECT_THROW(engineConfigFromYaml(YAML::Load("init_queue_capacity: 12")), ConfigError);
    EXPECT_THROW(engineConfigFromYaml(YAML::Load("event_queue_capacity: 0")), ConfigError);
    EXPECT_THROW(engineConfigFromYaml(YAML::Load("[1, 2]")), ConfigError);
}

TEST(EngineConfig, FileWithEngineSection) {
    const auto path = std::filesystem::temp_directory_path() / "pstrat_config_test.yaml";
    {
        std::ofstream f(path);
        f << "engine:\n  init_queue_capacity: 8\n  engine_type: live\nrunner:\n  bar_dir: bars\n";
    }
    const EngineConfig cfg = loadEngineConfig(path.string());
    EXPECT_EQ(cfg.initQueueCapacity, 8u);
    std::filesystem::remove(path);
}

TEST(EngineConfig, MissingFileThrows) {
    EXPECT_THROW(loadEngineConfig("/nonexistent/pstrat/config.yaml"), ConfigError);
}

TEST(EngineConfig, IntervalNames) {
    Interval i{};
    EXPECT_TRUE(parseInterval("1m", i));
    EXPECT_EQ(i, Interval::Minute);
    EXPECT_TRUE(parseInterval("daily", i));
    EXPECT_EQ(i, Interval::Daily);
    EXPECT_FALSE(parseInterval("5m", i));
    EXPECT_STREQ(toString(Interval::Hour), "1h");
    EXPECT_EQ(intervalNs(Interval::Hour), 3600ULL * 1000000000ULL);
}
