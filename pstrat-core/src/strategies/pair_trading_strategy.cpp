#include "pstrat/strategies/pair_trading_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace pstrat::strategies {

namespace {

constexpr std::size_t kSpreadHistory = 100;

std::uint64_t minuteOf(std::uint64_t tsNs) {
    return tsNs / core::intervalNs(core::Interval::Minute);
}

} // namespace

PairTradingStrategy::PairTradingStrategy(core::StrategyEngine& engine,
                                         std::string name,
                                         std::vector<std::string> instruments)
    : StrategyTemplate(engine, std::move(name), std::move(instruments)) {
    addParameter("tick_add", tickAdd_);
    addParameter("boll_window", bollWindow_);
    addParameter("boll_dev", bollDev_);
    addParameter("fixed_size", fixedSize_);
    addParameter("leg1_ratio", leg1Ratio_);
    addParameter("leg2_ratio", leg2Ratio_);

    addVariable("leg1_symbol", leg1Symbol_);
    addVariable("leg2_symbol", leg2Symbol_);
    addVariable("current_spread", currentSpread_);
    addVariable("boll_mid", bollMid_);
    addVariable("boll_down", bollDown_);
    addVariable("boll_up", bollUp_);

    // an empty list is allowed so the class can report its defaults
    const auto& legs = this->instruments();
    if (legs.empty()) return;
    if (legs.size() != 2) {
        throw std::invalid_argument("PairTradingStrategy needs exactly two instruments");
    }
    leg1Symbol_ = legs[0];
    leg2Symbol_ = legs[1];
    for (const auto& instrument : legs) generators_[instrument] = BarGenerator{};
}

void PairTradingStrategy::onInit() {
    writeLog("strategy initialized");
    loadBars(1);
}

void PairTradingStrategy::onStart() {
    writeLog("strategy started");
}

void PairTradingStrategy::onStop() {
    writeLog("strategy stopped");
}

void PairTradingStrategy::onTick(const core::TickData& tick) {
    auto it = generators_.find(tick.instrument);
    if (it == generators_.end()) return;

    const std::uint64_t minute = minuteOf(tick.tsNs);
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

void PairTradingStrategy::onBars(const core::BarMap& bars) {
    const auto leg1 = bars.find(leg1Symbol_);
    const auto leg2 = bars.find(leg2Symbol_);
    if (leg1 == bars.end() || leg2 == bars.end()) return;

    // one sample per five minutes, on the bar closing the block
    if ((minuteOf(leg1->second.tsNs) % 60 + 1) % 5 != 0) return;

    currentSpread_ = leg1->second.close * leg1Ratio_ - leg2->second.close * leg2Ratio_;
    spreadData_.push_back(currentSpread_);
    if (spreadData_.size() > kSpreadHistory) spreadData_.pop_front();

    ++spreadCount_;
    if (bollWindow_ <= 0 || spreadCount_ <= bollWindow_) return;
    updateBand();

    const int leg1Pos = pos(leg1Symbol_);
    if (leg1Pos == 0) {
        if (currentSpread_ >= bollUp_) {
            setTarget(leg1Symbol_, -fixedSize_);
            setTarget(leg2Symbol_, fixedSize_);
        } else if (currentSpread_ <= bollDown_) {
            setTarget(leg1Symbol_, fixedSize_);
            setTarget(leg2Symbol_, -fixedSize_);
        }
    } else if (leg1Pos > 0) {
        if (currentSpread_ >= bollMid_) {
            setTarget(leg1Symbol_, 0);
            setTarget(leg2Symbol_, 0);
        }
    } else if (currentSpread_ <= bollMid_) {
        setTarget(leg1Symbol_, 0);
        setTarget(leg2Symbol_, 0);
    }

    rebalancePortfolio(bars);
    putEvent();
}

void PairTradingStrategy::updateBand() {
    const std::size_t window = std::min(static_cast<std::size_t>(bollWindow_), spreadData_.size());
    const auto first = spreadData_.end() - static_cast<std::ptrdiff_t>(window);

    const double mean = std::accumulate(first, spreadData_.end(), 0.0) / static_cast<double>(window);
    double variance = 0.0;
    for (auto it = first; it != spreadData_.end(); ++it) {
        variance += (*it - mean) * (*it - mean);
    }
    const double stddev = std::sqrt(variance / static_cast<double>(window));

    bollMid_ = mean;
    bollUp_ = mean + bollDev_ * stddev;
    bollDown_ = mean - bollDev_ * stddev;
}

double PairTradingStrategy::calculatePrice(const std::string& instrument, core::Direction direction, double reference) {
    const double tick = pricetick(instrument).value_or(0.0);
    if (direction == core::Direction::Long) {
        return reference + tickAdd_ * tick;
    }
    return reference - tickAdd_ * tick;
}

} // namespace pstrat::strategies
