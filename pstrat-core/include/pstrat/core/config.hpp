#pragma once

#include <cstddef>
#include <string>

#include <yaml-cpp/yaml.h>

#include "pstrat/core/events.hpp"

namespace pstrat::core {

struct EngineConfig {
    std::string settingsPath{"portfolio_strategy_setting.yaml"};
    std::string dataPath{"portfolio_strategy_data.yaml"};
    std::size_t initQueueCapacity{64};      // power of two
    std::size_t eventQueueCapacity{1 << 14}; // power of two
    std::size_t tradeIdRetention{0};        // 0 = keep every id
    EngineType engineType{EngineType::Live};
    std::string logLevel{"info"};
    std::string logDir{};                   // empty = console only
    bool asyncLogging{true};
};

// Missing keys keep their defaults. Throws ConfigError on invalid values.
EngineConfig engineConfigFromYaml(const YAML::Node& node);

// Throws ConfigError when the file cannot be read or parsed
EngineConfig loadEngineConfig(const std::string& path);

} // namespace pstrat::core
