#include "pstrat/strategies/window_bar_generator.hpp"

#include <algorithm>
#include <utility>

namespace pstrat::strategies {

namespace {

void fold(core::BarMap& into, const core::BarData& bar) {
    auto [it, fresh] = into.try_emplace(bar.instrument, bar);
    core::BarData& acc = it->second;
    if (fresh) {
        acc.interval = core::Interval::Hour;
        return;
    }
    acc.high = std::max(acc.high, bar.high);
    acc.low = std::min(acc.low, bar.low);
    acc.close = bar.close;
    acc.volume += bar.volume;
}

} // namespace

WindowBarGenerator::WindowBarGenerator(int hours) : hours_(std::max(hours, 1)) {}

std::optional<core::BarMap> WindowBarGenerator::updateBars(const core::BarMap& minuteBars) {
    if (minuteBars.empty()) return std::nullopt;

    for (const auto& [instrument, bar] : minuteBars) {
        (void)instrument;
        fold(hourBars_, bar);
    }

    const std::uint64_t ts = minuteBars.begin()->second.tsNs;
    const std::uint64_t minuteOfHour = ts / core::intervalNs(core::Interval::Minute) % 60;
    if (minuteOfHour != 59) return std::nullopt;

    for (const auto& [instrument, bar] : hourBars_) {
        (void)instrument;
        fold(windowBars_, bar);
    }
    hourBars_.clear();

    const std::uint64_t hourOfDay = ts / core::intervalNs(core::Interval::Hour) % 24;
    if ((hourOfDay + 1) % static_cast<std::uint64_t>(hours_) != 0) return std::nullopt;

    core::BarMap out;
    out.swap(windowBars_);
    return out;
}

} // namespace pstrat::strategies
