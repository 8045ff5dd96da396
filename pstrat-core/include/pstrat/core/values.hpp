#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace pstrat::core {

// Primitive setting/variable value as persisted and reported
using Value = std::variant<std::int64_t, double, std::string, bool>;
using ValueMap = std::map<std::string, Value>;

// instrument -> signed lots
using PositionMap = std::map<std::string, int>;

std::string toString(const Value& v);

// Startup roster entry
struct StrategySetting {
    std::string className;
    std::vector<std::string> instruments;
    ValueMap setting;
};

using StrategySettingMap = std::map<std::string, StrategySetting>;

// Warm-restart state; initialized/trading flags are never persisted
struct StrategyData {
    ValueMap fields;
    PositionMap positions;
    PositionMap targets;
};

using StrategyDataMap = std::map<std::string, StrategyData>;

} // namespace pstrat::core
