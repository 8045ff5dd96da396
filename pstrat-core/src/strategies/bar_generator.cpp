#include "pstrat/strategies/bar_generator.hpp"

#include <algorithm>
#include <utility>

namespace pstrat::strategies {

void BarGenerator::updateTick(const core::TickData& tick) {
    if (tick.lastPrice <= 0.0) return;

    if (!bar_) {
        core::BarData bar{};
        bar.instrument = tick.instrument;
        bar.gateway = tick.gateway;
        bar.interval = core::Interval::Minute;
        const std::uint64_t minute = core::intervalNs(core::Interval::Minute);
        bar.tsNs = tick.tsNs - tick.tsNs % minute;
        bar.open = bar.high = bar.low = tick.lastPrice;
        bar_ = std::move(bar);
    }

    bar_->high = std::max(bar_->high, tick.lastPrice);
    bar_->low = std::min(bar_->low, tick.lastPrice);
    bar_->close = tick.lastPrice;
    bar_->volume += tick.volume;
}

std::optional<core::BarData> BarGenerator::generate() {
    std::optional<core::BarData> out;
    out.swap(bar_);
    return out;
}

} // namespace pstrat::strategies
