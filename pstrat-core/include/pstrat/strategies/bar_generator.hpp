#pragma once

#include <optional>

#include "pstrat/core/market_data.hpp"

namespace pstrat::strategies {

// Aggregates ticks of one instrument into a minute bar. The caller decides
// when the minute is over and collects the bar with generate().
class BarGenerator {
public:
    void updateTick(const core::TickData& tick);

    // Returns the bar built so far and starts a new one; empty when no tick
    // arrived since the last call.
    std::optional<core::BarData> generate();

    bool hasBar() const noexcept { return bar_.has_value(); }

private:
    std::optional<core::BarData> bar_{};
};

} // namespace pstrat::strategies
