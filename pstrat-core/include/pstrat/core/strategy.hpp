#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pstrat/core/events.hpp"
#include "pstrat/core/market_data.hpp"
#include "pstrat/core/order.hpp"
#include "pstrat/core/order_book.hpp"
#include "pstrat/core/parameters.hpp"
#include "pstrat/core/position_ledger.hpp"
#include "pstrat/core/trade.hpp"
#include "pstrat/core/values.hpp"

namespace pstrat::core {

class StrategyEngine; // fwd

// instrument -> reference price for one rebalance pass
using PriceMap = std::map<std::string, double>;

// Base every portfolio strategy derives from. A concrete strategy declares
// its parameters/variables in its constructor, decides targets in its hooks
// and calls rebalancePortfolio() to converge actual positions.
class StrategyTemplate {
public:
    StrategyTemplate(StrategyEngine& engine,
                     std::string name,
                     std::vector<std::string> instruments);
    virtual ~StrategyTemplate() = default;

    StrategyTemplate(const StrategyTemplate&) = delete;
    StrategyTemplate& operator=(const StrategyTemplate&) = delete;

    virtual std::string className() const = 0;
    virtual std::string author() const { return {}; }

    // Hooks, all run under the engine's fault isolation
    virtual void onInit() {}
    virtual void onStart() {}
    virtual void onStop() {}
    virtual void onTick(const TickData& tick) { (void)tick; }
    virtual void onBars(const BarMap& bars) { (void)bars; }
    virtual void onOrder(const OrderData& order) { (void)order; }
    virtual void onTrade(const TradeData& trade) { (void)trade; }

    // Engine-driven state updates
    void updateTrade(const TradeData& trade);
    void updateOrder(const OrderData& order);
    void updateSetting(const ValueMap& setting);

    const std::string& name() const noexcept { return name_; }
    const std::vector<std::string>& instruments() const noexcept { return instruments_; }

    StrategyState state() const noexcept;
    bool isInitialized() const noexcept { return initialized_.load(std::memory_order_acquire); }
    bool isTrading() const noexcept { return trading_.load(std::memory_order_acquire); }
    bool isInitializing() const noexcept { return initializing_.load(std::memory_order_acquire); }
    std::uint32_t faultCount() const noexcept { return faults_.load(std::memory_order_acquire); }

    ValueMap parameters() const { return parameters_.values(); }
    ValueMap variables() const { return variables_.values(); }
    std::vector<std::string> parameterNames() const { return parameters_.names(); }
    StrategySnapshot snapshot() const;

    // Persisted variables (flags excluded) and their warm-restart merge
    StrategyData data() const;
    void restoreData(const StrategyData& data);

    // Order helpers; no-ops returning no ids unless trading
    std::vector<std::string> buy(const std::string& instrument, double price, int volume, bool lock = false, bool net = false);
    std::vector<std::string> sell(const std::string& instrument, double price, int volume, bool lock = false, bool net = false);
    std::vector<std::string> shortSell(const std::string& instrument, double price, int volume, bool lock = false, bool net = false);
    std::vector<std::string> cover(const std::string& instrument, double price, int volume, bool lock = false, bool net = false);
    std::vector<std::string> sendOrder(const std::string& instrument,
                                       Direction direction,
                                       Offset offset,
                                       double price,
                                       int volume,
                                       bool lock = false,
                                       bool net = false);
    void cancelOrder(const std::string& orderId);
    void cancelAll();

    int pos(const std::string& instrument) const noexcept { return ledger_.position(instrument); }
    int target(const std::string& instrument) const noexcept { return ledger_.target(instrument); }
    void setTarget(const std::string& instrument, int target) { ledger_.setTarget(instrument, target); }
    const PositionLedger& ledger() const noexcept { return ledger_; }

    const OrderData* order(const std::string& orderId) const noexcept { return orders_.find(orderId); }
    std::vector<std::string> activeOrderIds() const { return orders_.activeIds(); }
    const OrderBook& orderBook() const noexcept { return orders_; }

    // Full cancel-and-replace convergence of positions towards targets for
    // the instruments present in this update.
    void rebalancePortfolio(const BarMap& bars);
    void rebalancePortfolio(const PriceMap& referencePrices);

    std::optional<double> pricetick(const std::string& instrument) const;
    std::optional<int> size(const std::string& instrument) const;
    EngineType engineType() const;

    void loadBars(int days, Interval interval = Interval::Minute);
    void putEvent();
    void syncData();
    void writeLog(const std::string& msg) const;

protected:
    virtual double calculatePrice(const std::string& instrument, Direction direction, double reference);

    template <typename T>
    void addParameter(const std::string& name, T& member) { parameters_.bind(name, member); }

    template <typename T>
    void addVariable(const std::string& name, T& member) { variables_.bind(name, member); }

    StrategyEngine& engine() noexcept { return engine_; }

private:
    friend class StrategyEngine;

    void setInitializing(bool v) noexcept { initializing_.store(v, std::memory_order_release); }
    void setInitialized(bool v) noexcept { initialized_.store(v, std::memory_order_release); }
    void setTrading(bool v) noexcept { trading_.store(v, std::memory_order_release); }
    void setStopped(bool v) noexcept { stopped_.store(v, std::memory_order_release); }
    void recordFault() noexcept;

    StrategyEngine& engine_;
    std::string name_;
    std::vector<std::string> instruments_;

    std::atomic<bool> initializing_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> trading_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint32_t> faults_{0};

    ParameterSet parameters_{};
    ParameterSet variables_{};
    PositionLedger ledger_{};
    OrderBook orders_{};
};

} // namespace pstrat::core
