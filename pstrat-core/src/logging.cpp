#include "pstrat/core/logging.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace pstrat::core {

std::shared_ptr<spdlog::logger> makeLogger(const EngineConfig& cfg, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.logDir.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(cfg.logDir + "/" + name + ".log", 0, 0));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.asyncLogging) {
        spdlog::init_thread_pool(8192, 1);
        logger = std::make_shared<spdlog::async_logger>(name, sinks.begin(), sinks.end(),
                                                        spdlog::thread_pool(),
                                                        spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    logger->set_level(spdlog::level::from_str(cfg.logLevel));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace pstrat::core
