#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace pstrat::core {

enum class Interval : std::uint8_t { Minute, Hour, Daily };

const char* toString(Interval i) noexcept;
bool parseInterval(const std::string& text, Interval& out) noexcept;
std::uint64_t intervalNs(Interval i) noexcept;

// Static metadata for one tradable contract.
struct ContractData {
    std::string instrument;
    std::string symbol;
    std::string venue;
    std::string gateway;
    double tickSize{};
    int lotSize{1};
    int size{1};              // contract multiplier
    bool historyData{false};  // gateway can serve history requests
};

struct SubscribeRequest {
    std::string instrument;
    std::string symbol;
    std::string venue;
};

struct HistoryRequest {
    std::string instrument;
    std::string symbol;
    std::string venue;
    Interval interval{Interval::Minute};
    std::uint64_t startNs{};
    std::uint64_t endNs{};
};

struct TickData {
    std::string instrument;
    std::string gateway;
    std::uint64_t tsNs{};
    double lastPrice{};
    int volume{};
    double bidPrice{};
    double askPrice{};
    int bidVolume{};
    int askVolume{};
};

struct BarData {
    std::string instrument;
    std::string gateway;
    std::uint64_t tsNs{};     // bar open time
    Interval interval{Interval::Minute};
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

// One bar per instrument for a single timestamp
using BarMap = std::map<std::string, BarData>;

} // namespace pstrat::core
