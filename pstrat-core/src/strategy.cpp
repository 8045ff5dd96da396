#include "pstrat/core/strategy.hpp"
#include "pstrat/core/strategy_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace pstrat::core {

StrategyTemplate::StrategyTemplate(StrategyEngine& engine,
                                   std::string name,
                                   std::vector<std::string> instruments)
    : engine_(engine), name_(std::move(name)), instruments_(std::move(instruments)) {}

StrategyState StrategyTemplate::state() const noexcept {
    if (isInitializing()) return StrategyState::Initializing;
    if (isTrading()) return StrategyState::Trading;
    if (isInitialized()) {
        return stopped_.load(std::memory_order_acquire) ? StrategyState::Stopped : StrategyState::Initialized;
    }
    return StrategyState::Created;
}

void StrategyTemplate::recordFault() noexcept {
    faults_.fetch_add(1, std::memory_order_acq_rel);
    trading_.store(false, std::memory_order_release);
    initialized_.store(false, std::memory_order_release);
}

void StrategyTemplate::updateTrade(const TradeData& trade) {
    ledger_.applyFill(trade);
    onTrade(trade);
}

void StrategyTemplate::updateOrder(const OrderData& order) {
    orders_.update(order);
    onOrder(order);
}

void StrategyTemplate::updateSetting(const ValueMap& setting) {
    for (const auto& [key, value] : setting) {
        if (!parameters_.contains(key)) continue;
        if (!parameters_.assign(key, value)) {
            engine_.writeLog("parameter " + key + " ignored, incompatible value " + toString(value),
                             this, LogEvent::Level::Warn);
        }
    }
}

StrategyData StrategyTemplate::data() const {
    StrategyData d{};
    d.fields = variables_.values();
    d.positions = ledger_.positions();
    d.targets = ledger_.targets();
    return d;
}

void StrategyTemplate::restoreData(const StrategyData& data) {
    for (const auto& [key, value] : data.fields) {
        if (key == "initialized" || key == "trading") continue;
        (void)variables_.assign(key, value);
    }
    ledger_.mergePositions(data.positions);
    ledger_.mergeTargets(data.targets);
}

StrategySnapshot StrategyTemplate::snapshot() const {
    StrategySnapshot s{};
    s.name = name_;
    s.className = className();
    s.author = author();
    s.instruments = instruments_;
    s.state = state();
    s.parameters = parameters_.values();
    s.variables = variables_.values();
    s.initialized = isInitialized();
    s.trading = isTrading();
    s.positions = ledger_.positions();
    s.targets = ledger_.targets();
    return s;
}

std::vector<std::string> StrategyTemplate::buy(const std::string& instrument, double price, int volume, bool lock, bool net) {
    return sendOrder(instrument, Direction::Long, Offset::Open, price, volume, lock, net);
}

std::vector<std::string> StrategyTemplate::sell(const std::string& instrument, double price, int volume, bool lock, bool net) {
    return sendOrder(instrument, Direction::Short, Offset::Close, price, volume, lock, net);
}

std::vector<std::string> StrategyTemplate::shortSell(const std::string& instrument, double price, int volume, bool lock, bool net) {
    return sendOrder(instrument, Direction::Short, Offset::Open, price, volume, lock, net);
}

std::vector<std::string> StrategyTemplate::cover(const std::string& instrument, double price, int volume, bool lock, bool net) {
    return sendOrder(instrument, Direction::Long, Offset::Close, price, volume, lock, net);
}

std::vector<std::string> StrategyTemplate::sendOrder(const std::string& instrument,
                                                     Direction direction,
                                                     Offset offset,
                                                     double price,
                                                     int volume,
                                                     bool lock,
                                                     bool net) {
    if (!isTrading()) return {};
    return engine_.sendOrder(*this, instrument, direction, offset, price, volume, lock, net);
}

void StrategyTemplate::cancelOrder(const std::string& orderId) {
    if (!isTrading()) return;
    engine_.cancelOrder(*this, orderId);
}

void StrategyTemplate::cancelAll() {
    for (const auto& id : orders_.activeIds()) {
        cancelOrder(id);
    }
}

double StrategyTemplate::calculatePrice(const std::string& instrument, Direction direction, double reference) {
    (void)instrument; (void)direction;
    return reference;
}

void StrategyTemplate::rebalancePortfolio(const BarMap& bars) {
    PriceMap refs;
    for (const auto& [instrument, bar] : bars) {
        refs[instrument] = bar.close;
    }
    rebalancePortfolio(refs);
}

void StrategyTemplate::rebalancePortfolio(const PriceMap& referencePrices) {
    cancelAll();

    for (const auto& [instrument, reference] : referencePrices) {
        const int position = pos(instrument);
        const int diff = target(instrument) - position;

        if (diff > 0) {
            const double price = calculatePrice(instrument, Direction::Long, reference);
            const int coverVolume = std::min(diff, std::max(0, -position));
            const int buyVolume = diff - coverVolume;
            if (coverVolume) cover(instrument, price, coverVolume);
            if (buyVolume) buy(instrument, price, buyVolume);
        } else if (diff < 0) {
            const double price = calculatePrice(instrument, Direction::Short, reference);
            const int sellVolume = std::min(std::abs(diff), std::max(0, position));
            const int shortVolume = std::abs(diff) - sellVolume;
            if (sellVolume) sell(instrument, price, sellVolume);
            if (shortVolume) shortSell(instrument, price, shortVolume);
        }
    }
}

std::optional<double> StrategyTemplate::pricetick(const std::string& instrument) const {
    return engine_.pricetick(*this, instrument);
}

std::optional<int> StrategyTemplate::size(const std::string& instrument) const {
    return engine_.size(*this, instrument);
}

EngineType StrategyTemplate::engineType() const {
    return engine_.engineType();
}

void StrategyTemplate::loadBars(int days, Interval interval) {
    engine_.loadBars(*this, days, interval);
}

void StrategyTemplate::putEvent() {
    if (isInitialized()) engine_.putStrategyEvent(*this);
}

void StrategyTemplate::syncData() {
    if (isTrading()) engine_.syncStrategyData(*this);
}

void StrategyTemplate::writeLog(const std::string& msg) const {
    engine_.writeLog(msg, this);
}

} // namespace pstrat::core
