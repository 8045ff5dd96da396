#pragma once

#include <cstdint>
#include <string>

#include "pstrat/core/order.hpp"

namespace pstrat::core {

struct TradeData {
    std::string tradeId;    // unique per fill across the feed
    std::string orderId;    // order that produced the fill
    std::string instrument;
    std::string gateway;
    Direction direction{Direction::Long};
    Offset offset{Offset::None};
    double price{};
    int volume{};           // lots, always positive
    std::uint64_t tsNs{};

    // +volume for a buy-side fill, -volume for a sell-side fill
    int signedVolume() const noexcept { return direction == Direction::Long ? volume : -volume; }
};

} // namespace pstrat::core
