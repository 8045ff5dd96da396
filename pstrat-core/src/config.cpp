#include "pstrat/core/config.hpp"
#include "pstrat/core/errors.hpp"
#include "pstrat/core/ring_buffer.hpp"

namespace pstrat::core {

EngineConfig engineConfigFromYaml(const YAML::Node& node) {
    EngineConfig cfg{};
    if (!node || node.IsNull()) return cfg;
    if (!node.IsMap()) throw ConfigError("engine config must be a mapping");

    try {
        cfg.settingsPath = node["settings_file"].as<std::string>(cfg.settingsPath);
        cfg.dataPath = node["data_file"].as<std::string>(cfg.dataPath);
        cfg.initQueueCapacity = node["init_queue_capacity"].as<std::size_t>(cfg.initQueueCapacity);
        cfg.eventQueueCapacity = node["event_queue_capacity"].as<std::size_t>(cfg.eventQueueCapacity);
        cfg.tradeIdRetention = node["trade_id_retention"].as<std::size_t>(cfg.tradeIdRetention);
        cfg.logLevel = node["log_level"].as<std::string>(cfg.logLevel);
        cfg.logDir = node["log_dir"].as<std::string>(cfg.logDir);
        cfg.asyncLogging = node["async_logging"].as<bool>(cfg.asyncLogging);

        const auto type = node["engine_type"].as<std::string>("live");
        if (type == "live") {
            cfg.engineType = EngineType::Live;
        } else if (type == "backtesting") {
            cfg.engineType = EngineType::Backtesting;
        } else {
            throw ConfigError("unknown engine_type: " + type);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("engine config: ") + e.what());
    }

    if (!RingBuffer<int>::isPowerOfTwo(cfg.initQueueCapacity)) {
        throw ConfigError("init_queue_capacity must be a power of two");
    }
    if (!RingBuffer<int>::isPowerOfTwo(cfg.eventQueueCapacity)) {
        throw ConfigError("event_queue_capacity must be a power of two");
    }
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    const YAML::Node& doc = root;
    if (doc.IsMap() && doc["engine"]) return engineConfigFromYaml(doc["engine"]);
    return engineConfigFromYaml(doc);
}

} // namespace pstrat::core
