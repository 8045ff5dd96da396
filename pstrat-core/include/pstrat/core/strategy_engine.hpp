#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pstrat/core/config.hpp"
#include "pstrat/core/events.hpp"
#include "pstrat/core/gateway.hpp"
#include "pstrat/core/history/history_source.hpp"
#include "pstrat/core/init_worker.hpp"
#include "pstrat/core/settings_store.hpp"
#include "pstrat/core/strategy.hpp"
#include "pstrat/core/strategy_factory.hpp"
#include "pstrat/core/strategy_registry.hpp"

namespace pstrat::core {

// Top-level coordinator: owns the strategy registry, routes external events
// to strategy instances, drives their lifecycle and serves the operations a
// strategy needs (orders, contract metadata, history, persistence).
//
// Event handlers, order placement and lifecycle calls belong to one control
// thread. Initialization runs on the engine's own init worker.
class StrategyEngine {
public:
    static constexpr const char* kAppName = "PortfolioStrategy";

    StrategyEngine(BrokerGateway& gateway,
                   SettingsStore& store,
                   const StrategyFactory& factory,
                   EngineConfig config = {},
                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~StrategyEngine();

    StrategyEngine(const StrategyEngine&) = delete;
    StrategyEngine& operator=(const StrategyEngine&) = delete;

    void setEventSink(EventSink* sink) noexcept { sink_ = sink; }
    void setDatafeed(history::HistorySource* source) noexcept { datafeed_ = source; }
    void setDatabase(history::HistorySource* source) noexcept { database_ = source; }

    // Loads roster and persisted variables, re-creates strategies.
    // The init worker runs from construction until close().
    void init();
    // Stops every strategy, then the init worker
    void close();

    // External events
    void processTick(const TickData& tick);
    void processOrder(const OrderData& order);
    void processTrade(const TradeData& trade);
    void processEvent(const EngineEvent& ev);

    // Strategy management
    bool addStrategy(const std::string& className,
                     const std::string& name,
                     const std::vector<std::string>& instruments,
                     const ValueMap& setting);
    bool initStrategy(const std::string& name);
    bool startStrategy(const std::string& name);
    bool stopStrategy(const std::string& name);
    bool editStrategy(const std::string& name, const ValueMap& setting);
    bool removeStrategy(const std::string& name);
    void initAllStrategies();
    void startAllStrategies();
    void stopAllStrategies();

    // Blocks until queued initializations have finished
    void waitForInit() const { initWorker_.waitIdle(); }

    // Called by strategies
    std::vector<std::string> sendOrder(StrategyTemplate& strategy,
                                       const std::string& instrument,
                                       Direction direction,
                                       Offset offset,
                                       double price,
                                       int volume,
                                       bool lock,
                                       bool net);
    bool cancelOrder(StrategyTemplate& strategy, const std::string& orderId);
    std::optional<double> pricetick(const StrategyTemplate& strategy, const std::string& instrument) const;
    std::optional<int> size(const StrategyTemplate& strategy, const std::string& instrument) const;
    void loadBars(StrategyTemplate& strategy, int days, Interval interval);
    std::vector<BarData> loadBar(const std::string& instrument, int days, Interval interval);
    void syncStrategyData(const StrategyTemplate& strategy);
    void putStrategyEvent(const StrategyTemplate& strategy);
    void writeLog(const std::string& msg,
                  const StrategyTemplate* strategy = nullptr,
                  LogEvent::Level level = LogEvent::Level::Info,
                  std::optional<ErrorCode> code = std::nullopt) const;

    // Queries
    EngineType engineType() const noexcept { return config_.engineType; }
    const EngineConfig& config() const noexcept { return config_; }
    std::vector<std::string> strategyClassNames() const { return factory_.classNames(); }
    std::optional<ValueMap> strategyClassParameters(const std::string& className);
    std::optional<ValueMap> strategyParameters(const std::string& name) const;
    std::optional<StrategySnapshot> strategySnapshot(const std::string& name) const;
    StrategyTemplate* strategy(const std::string& name) const noexcept { return registry_.find(name); }
    std::vector<std::string> strategyNames() const { return registry_.names(); }
    const StrategyRegistry& registry() const noexcept { return registry_; }

private:
    bool addStrategyImpl(const std::string& className,
                         const std::string& name,
                         const std::vector<std::string>& instruments,
                         const ValueMap& setting,
                         bool persist);
    void runInit(StrategyTemplate& strategy);
    void failInit(StrategyTemplate& strategy);
    // Sink failures are logged, never propagated
    void emitSnapshot(const StrategySnapshot& snap);

    // Runs a strategy hook; any exception takes the instance offline.
    // Returns false when the hook faulted.
    bool callStrategyFunc(StrategyTemplate& strategy, const char* hook, const std::function<void()>& fn);

    StrategyTemplate* lookup(const std::string& name, const char* action) const;
    void saveStrategySetting();
    void loadStrategySetting();
    void loadStrategyData();

    BrokerGateway& gateway_;
    SettingsStore& store_;
    const StrategyFactory& factory_;
    EngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    EventSink* sink_{nullptr};
    history::HistorySource* datafeed_{nullptr};
    history::HistorySource* database_{nullptr};

    StrategyRegistry registry_;
    InitWorker initWorker_;

    // Shared by the control thread (stop/sync) and the init worker (restore)
    mutable std::mutex dataMutex_;
    StrategyDataMap strategyData_{};
};

} // namespace pstrat::core
