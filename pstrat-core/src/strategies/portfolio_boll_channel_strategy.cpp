#include "pstrat/strategies/portfolio_boll_channel_strategy.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace pstrat::strategies {

PortfolioBollChannelStrategy::PortfolioBollChannelStrategy(core::StrategyEngine& engine,
                                                           std::string name,
                                                           std::vector<std::string> instruments)
    : StrategyTemplate(engine, std::move(name), std::move(instruments)) {
    addParameter("boll_window", bollWindow_);
    addParameter("boll_dev", bollDev_);
    addParameter("cci_window", cciWindow_);
    addParameter("atr_window", atrWindow_);
    addParameter("sl_multiplier", slMultiplier_);
    addParameter("fixed_size", fixedSize_);
    addParameter("price_add", priceAdd_);

    for (const auto& instrument : this->instruments()) {
        ams_.emplace(instrument, ArrayManager{});
        generators_[instrument] = BarGenerator{};
    }
}

void PortfolioBollChannelStrategy::onInit() {
    writeLog("strategy initialized");
    loadBars(10);
}

void PortfolioBollChannelStrategy::onStart() {
    writeLog("strategy started");
}

void PortfolioBollChannelStrategy::onStop() {
    writeLog("strategy stopped");
}

void PortfolioBollChannelStrategy::onTick(const core::TickData& tick) {
    auto it = generators_.find(tick.instrument);
    if (it == generators_.end()) return;

    const std::uint64_t minute = tick.tsNs / core::intervalNs(core::Interval::Minute);
    if (hasLastTick_ && minute != lastTickMinute_) {
        core::BarMap bars;
        for (auto& [instrument, generator] : generators_) {
            if (auto bar = generator.generate()) bars[instrument] = std::move(*bar);
        }
        onBars(bars);
    }

    it->second.updateTick(tick);
    lastTickMinute_ = minute;
    hasLastTick_ = true;
}

void PortfolioBollChannelStrategy::onBars(const core::BarMap& bars) {
    if (auto window = windowGenerator_.updateBars(bars)) {
        onWindowBars(*window);
    }
}

void PortfolioBollChannelStrategy::onWindowBars(const core::BarMap& bars) {
    cancelAll();

    for (const auto& [instrument, bar] : bars) {
        auto am = ams_.find(instrument);
        if (am != ams_.end()) am->second.updateBar(bar);
    }

    for (const auto& [instrument, bar] : bars) {
        auto amIt = ams_.find(instrument);
        if (amIt == ams_.end()) continue;
        const ArrayManager& am = amIt->second;
        // every instrument needs a full history before any signal
        if (!am.inited()) return;

        const auto band = am.boll(bollWindow_, bollDev_);
        bollUp_[instrument] = band.first;
        bollDown_[instrument] = band.second;
        const double cci = am.cci(cciWindow_);
        const double atr = am.atr(atrWindow_);

        const int current = pos(instrument);
        if (current == 0) {
            intraTradeHigh_[instrument] = bar.high;
            intraTradeLow_[instrument] = bar.low;
            if (cci > 0) {
                setTarget(instrument, fixedSize_);
            } else if (cci < 0) {
                setTarget(instrument, -fixedSize_);
            }
        } else if (current > 0) {
            intraTradeHigh_[instrument] = std::max(intraTradeHigh_[instrument], bar.high);
            intraTradeLow_[instrument] = bar.low;
            const double longStop = intraTradeHigh_[instrument] - atr * slMultiplier_;
            if (bar.close <= longStop) setTarget(instrument, 0);
        } else {
            intraTradeLow_[instrument] = std::min(intraTradeLow_[instrument], bar.low);
            intraTradeHigh_[instrument] = bar.high;
            const double shortStop = intraTradeLow_[instrument] + atr * slMultiplier_;
            if (bar.close >= shortStop) setTarget(instrument, 0);
        }
    }

    for (const auto& instrument : instruments()) {
        const auto barIt = bars.find(instrument);
        if (barIt == bars.end()) continue;
        const core::BarData& bar = barIt->second;

        const int current = pos(instrument);
        const int diff = target(instrument) - current;
        const int volume = std::abs(diff);

        if (diff > 0) {
            if (current < 0) {
                cover(instrument, bar.close + priceAdd_, volume);
            } else {
                buy(instrument, bollUp_[instrument], volume);
            }
        } else if (diff < 0) {
            if (current > 0) {
                sell(instrument, bar.close - priceAdd_, volume);
            } else {
                shortSell(instrument, bollDown_[instrument], volume);
            }
        }
    }

    putEvent();
}

} // namespace pstrat::strategies
