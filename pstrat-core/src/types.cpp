#include "pstrat/core/errors.hpp"
#include "pstrat/core/events.hpp"
#include "pstrat/core/market_data.hpp"
#include "pstrat/core/order.hpp"
#include "pstrat/core/values.hpp"

#include <sstream>
#include <type_traits>

namespace pstrat::core {

const char* toString(Direction d) noexcept {
    return d == Direction::Long ? "Long" : "Short";
}

const char* toString(Offset o) noexcept {
    switch (o) {
        case Offset::None: return "None";
        case Offset::Open: return "Open";
        case Offset::Close: return "Close";
        case Offset::CloseToday: return "CloseToday";
        case Offset::CloseYesterday: return "CloseYesterday";
    }
    return "?";
}

const char* toString(OrderStatus s) noexcept {
    switch (s) {
        case OrderStatus::Submitting: return "Submitting";
        case OrderStatus::NotTraded: return "NotTraded";
        case OrderStatus::PartTraded: return "PartTraded";
        case OrderStatus::AllTraded: return "AllTraded";
        case OrderStatus::Cancelled: return "Cancelled";
        case OrderStatus::Rejected: return "Rejected";
    }
    return "?";
}

const char* toString(Interval i) noexcept {
    switch (i) {
        case Interval::Minute: return "1m";
        case Interval::Hour: return "1h";
        case Interval::Daily: return "d";
    }
    return "?";
}

bool parseInterval(const std::string& text, Interval& out) noexcept {
    if (text == "1m" || text == "minute") { out = Interval::Minute; return true; }
    if (text == "1h" || text == "hour") { out = Interval::Hour; return true; }
    if (text == "d" || text == "1d" || text == "daily") { out = Interval::Daily; return true; }
    return false;
}

std::uint64_t intervalNs(Interval i) noexcept {
    constexpr std::uint64_t minute = 60ULL * 1000000000ULL;
    switch (i) {
        case Interval::Minute: return minute;
        case Interval::Hour: return 60ULL * minute;
        case Interval::Daily: return 24ULL * 60ULL * minute;
    }
    return minute;
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ContractNotFound: return "ContractNotFound";
        case ErrorCode::DuplicateStrategyName: return "DuplicateStrategyName";
        case ErrorCode::UnknownStrategyClass: return "UnknownStrategyClass";
        case ErrorCode::UnknownStrategy: return "UnknownStrategy";
        case ErrorCode::InvalidLifecycleTransition: return "InvalidLifecycleTransition";
        case ErrorCode::StrategyCallbackFault: return "StrategyCallbackFault";
        case ErrorCode::InitQueueFull: return "InitQueueFull";
        case ErrorCode::PersistenceFailure: return "PersistenceFailure";
    }
    return "?";
}

const char* toString(EngineType t) noexcept {
    return t == EngineType::Live ? "Live" : "Backtesting";
}

const char* toString(StrategyState s) noexcept {
    switch (s) {
        case StrategyState::Created: return "Created";
        case StrategyState::Initializing: return "Initializing";
        case StrategyState::Initialized: return "Initialized";
        case StrategyState::Trading: return "Trading";
        case StrategyState::Stopped: return "Stopped";
    }
    return "?";
}

std::string toString(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else {
            std::ostringstream os;
            os << x;
            return os.str();
        }
    }, v);
}

} // namespace pstrat::core
