#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "pstrat/core/config.hpp"

namespace pstrat::core {

// Console logger, plus a daily rotating file under cfg.logDir when set.
// Registered with spdlog under `name` and installed as the default logger.
std::shared_ptr<spdlog::logger> makeLogger(const EngineConfig& cfg, const std::string& name);

} // namespace pstrat::core
