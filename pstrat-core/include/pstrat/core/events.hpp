#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "pstrat/core/errors.hpp"
#include "pstrat/core/market_data.hpp"
#include "pstrat/core/order.hpp"
#include "pstrat/core/trade.hpp"
#include "pstrat/core/values.hpp"

namespace pstrat::core {

enum class EngineType : std::uint8_t { Live, Backtesting };
enum class StrategyState : std::uint8_t { Created, Initializing, Initialized, Trading, Stopped };

const char* toString(EngineType t) noexcept;
const char* toString(StrategyState s) noexcept;

// External event delivered to the control thread
using EngineEvent = std::variant<TickData, OrderData, TradeData>;

struct LogEvent {
    enum class Level : std::uint8_t { Info, Warn, Error };

    Level level{Level::Info};
    std::string strategyName;        // empty for engine-level messages
    std::string message;
    std::optional<ErrorCode> code{};
};

// Full state-changed payload for presentation layers
struct StrategySnapshot {
    std::string name;
    std::string className;
    std::string author;
    std::vector<std::string> instruments;
    StrategyState state{StrategyState::Created};
    ValueMap parameters;
    ValueMap variables;
    bool initialized{false};
    bool trading{false};
    PositionMap positions;
    PositionMap targets;
};

} // namespace pstrat::core
