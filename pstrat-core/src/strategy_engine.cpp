#include "pstrat/core/strategy_engine.hpp"
#include "pstrat/core/history/bar_merge.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <type_traits>
#include <utility>

namespace pstrat::core {

namespace {

double roundTo(double value, double step) {
    if (step <= 0.0) return value;
    return std::round(value / step) * step;
}

int roundLots(int volume, int lotSize) {
    if (lotSize <= 1) return volume;
    return static_cast<int>(std::lround(static_cast<double>(volume) / lotSize)) * lotSize;
}

std::uint64_t nowNs() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

StrategyEngine::StrategyEngine(BrokerGateway& gateway,
                               SettingsStore& store,
                               const StrategyFactory& factory,
                               EngineConfig config,
                               std::shared_ptr<spdlog::logger> logger)
    : gateway_(gateway),
      store_(store),
      factory_(factory),
      config_(std::move(config)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      registry_(config_.tradeIdRetention),
      initWorker_(config_.initQueueCapacity) {
    initWorker_.start();
}

StrategyEngine::~StrategyEngine() {
    initWorker_.stop();
}

void StrategyEngine::init() {
    loadStrategyData();
    loadStrategySetting();
    writeLog(std::string("engine initialized (") + toString(config_.engineType) + ")");
}

void StrategyEngine::close() {
    stopAllStrategies();
    initWorker_.stop();
}

// ---------------------- External events ----------------------

void StrategyEngine::processTick(const TickData& tick) {
    const auto& subscribers = registry_.strategiesFor(tick.instrument);
    if (subscribers.empty()) return;

    for (StrategyTemplate* s : subscribers) {
        if (s->isInitialized()) {
            callStrategyFunc(*s, "onTick", [s, &tick] { s->onTick(tick); });
        }
    }
}

void StrategyEngine::processOrder(const OrderData& order) {
    StrategyTemplate* s = registry_.strategyForOrder(order.orderId);
    if (!s) return;
    callStrategyFunc(*s, "onOrder", [s, &order] { s->updateOrder(order); });
}

void StrategyEngine::processTrade(const TradeData& trade) {
    // feeds may redeliver; first delivery wins
    if (!registry_.markTradeSeen(trade.tradeId)) return;

    StrategyTemplate* s = registry_.strategyForOrder(trade.orderId);
    if (!s) return;
    callStrategyFunc(*s, "onTrade", [s, &trade] { s->updateTrade(trade); });
}

void StrategyEngine::processEvent(const EngineEvent& ev) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TickData>) {
            processTick(e);
        } else if constexpr (std::is_same_v<T, OrderData>) {
            processOrder(e);
        } else {
            processTrade(e);
        }
    }, ev);
}

// ---------------------- Orders ----------------------

std::vector<std::string> StrategyEngine::sendOrder(StrategyTemplate& strategy,
                                                   const std::string& instrument,
                                                   Direction direction,
                                                   Offset offset,
                                                   double price,
                                                   int volume,
                                                   bool lock,
                                                   bool net) {
    const auto contract = gateway_.getContract(instrument);
    if (!contract) {
        writeLog("order failed, contract not found: " + instrument, &strategy,
                 LogEvent::Level::Warn, ErrorCode::ContractNotFound);
        return {};
    }

    OrderRequest req{};
    req.instrument = instrument;
    req.symbol = contract->symbol;
    req.venue = contract->venue;
    req.direction = direction;
    req.offset = offset;
    req.type = OrderType::Limit;
    req.price = roundTo(price, contract->tickSize);
    req.volume = roundLots(volume, contract->lotSize);
    req.reference = std::string(kAppName) + "_" + strategy.name();
    if (req.volume <= 0) {
        writeLog("order skipped, volume " + std::to_string(volume) + " rounds to zero lots for " + instrument,
                 &strategy, LogEvent::Level::Warn);
        return {};
    }

    std::vector<std::string> orderIds;
    for (const auto& child : gateway_.convertOrderRequest(req, contract->gateway, lock, net)) {
        std::string orderId = gateway_.sendOrder(child, contract->gateway);
        if (orderId.empty()) continue;

        gateway_.updateOrderRequest(child, orderId, contract->gateway);
        registry_.bindOrder(orderId, strategy);
        strategy.orders_.track(orderId);
        orderIds.push_back(std::move(orderId));
    }
    return orderIds;
}

bool StrategyEngine::cancelOrder(StrategyTemplate& strategy, const std::string& orderId) {
    const auto order = gateway_.getOrder(orderId);
    if (!order) {
        writeLog("cancel failed, order not found: " + orderId, &strategy, LogEvent::Level::Warn);
        return false;
    }
    gateway_.cancelOrder(order->cancelRequest(), order->gateway);
    return true;
}

std::optional<double> StrategyEngine::pricetick(const StrategyTemplate& strategy, const std::string& instrument) const {
    (void)strategy;
    const auto contract = gateway_.getContract(instrument);
    if (!contract) return std::nullopt;
    return contract->tickSize;
}

std::optional<int> StrategyEngine::size(const StrategyTemplate& strategy, const std::string& instrument) const {
    (void)strategy;
    const auto contract = gateway_.getContract(instrument);
    if (!contract) return std::nullopt;
    return contract->size;
}

// ---------------------- History ----------------------

void StrategyEngine::loadBars(StrategyTemplate& strategy, int days, Interval interval) {
    std::map<std::string, std::vector<BarData>> series;
    for (const auto& instrument : strategy.instruments()) {
        series[instrument] = loadBar(instrument, days, interval);
    }

    for (const auto& bars : history::mergeBars(strategy.instruments(), series)) {
        if (!callStrategyFunc(strategy, "onBars", [&strategy, &bars] { strategy.onBars(bars); })) {
            break;
        }
    }
}

std::vector<BarData> StrategyEngine::loadBar(const std::string& instrument, int days, Interval interval) {
    constexpr std::uint64_t kDayNs = 24ULL * 3600ULL * 1000000000ULL;
    const std::uint64_t end = nowNs();
    const std::uint64_t span = static_cast<std::uint64_t>(std::max(days, 0)) * kDayNs;

    HistoryRequest req{};
    req.instrument = instrument;
    req.interval = interval;
    req.startNs = end > span ? end - span : 0;
    req.endNs = end;

    const auto contract = gateway_.getContract(instrument);
    if (contract) {
        req.symbol = contract->symbol;
        req.venue = contract->venue;
    }

    std::vector<BarData> data;
    if (contract && contract->historyData) {
        data = gateway_.queryHistory(req, contract->gateway);
    } else if (datafeed_) {
        data = datafeed_->queryBars(req);
    }
    if (data.empty() && database_) {
        data = database_->queryBars(req);
    }
    return data;
}

// ---------------------- Lifecycle ----------------------

bool StrategyEngine::addStrategy(const std::string& className,
                                 const std::string& name,
                                 const std::vector<std::string>& instruments,
                                 const ValueMap& setting) {
    return addStrategyImpl(className, name, instruments, setting, true);
}

bool StrategyEngine::addStrategyImpl(const std::string& className,
                                     const std::string& name,
                                     const std::vector<std::string>& instruments,
                                     const ValueMap& setting,
                                     bool persist) {
    if (registry_.contains(name)) {
        writeLog("create strategy failed, duplicate name " + name, nullptr,
                 LogEvent::Level::Warn, ErrorCode::DuplicateStrategyName);
        return false;
    }
    if (!factory_.contains(className)) {
        writeLog("create strategy failed, class not found " + className, nullptr,
                 LogEvent::Level::Warn, ErrorCode::UnknownStrategyClass);
        return false;
    }

    std::unique_ptr<StrategyTemplate> created;
    try {
        created = factory_.create(className, *this, name, instruments, setting);
    } catch (const std::exception& e) {
        writeLog("create strategy " + name + " failed: " + e.what(), nullptr,
                 LogEvent::Level::Error, ErrorCode::StrategyCallbackFault);
        return false;
    }
    if (!created) {
        writeLog("create strategy failed, class not found " + className, nullptr,
                 LogEvent::Level::Warn, ErrorCode::UnknownStrategyClass);
        return false;
    }

    StrategyTemplate& strategy = *created;
    if (!registry_.add(std::move(created))) return false;
    if (persist) saveStrategySetting();
    putStrategyEvent(strategy);
    return true;
}

bool StrategyEngine::initStrategy(const std::string& name) {
    StrategyTemplate* s = lookup(name, "init");
    if (!s) return false;

    if (s->isInitializing() || s->isInitialized()) {
        writeLog("already initialized, repeated init ignored", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }

    s->setInitializing(true);
    putStrategyEvent(*s);
    if (!initWorker_.submit([this, s] { runInit(*s); })) {
        s->setInitializing(false);
        putStrategyEvent(*s);
        writeLog("init queue full, initialization not scheduled", s,
                 LogEvent::Level::Warn, ErrorCode::InitQueueFull);
        return false;
    }
    return true;
}

void StrategyEngine::runInit(StrategyTemplate& strategy) {
    writeLog("initialization started", &strategy);

    const std::uint32_t faultsBefore = strategy.faultCount();
    const bool ok = callStrategyFunc(strategy, "onInit", [&strategy] { strategy.onInit(); });
    if (!ok || strategy.faultCount() != faultsBefore) {
        failInit(strategy);
        return;
    }

    try {
        std::optional<StrategyData> saved;
        {
            std::lock_guard<std::mutex> lock(dataMutex_);
            auto it = strategyData_.find(strategy.name());
            if (it != strategyData_.end()) saved = it->second;
        }
        if (saved) strategy.restoreData(*saved);

        for (const auto& instrument : strategy.instruments()) {
            const auto contract = gateway_.getContract(instrument);
            if (!contract) {
                writeLog("market data subscription failed, contract not found: " + instrument, &strategy,
                         LogEvent::Level::Warn, ErrorCode::ContractNotFound);
                continue;
            }
            gateway_.subscribe(SubscribeRequest{instrument, contract->symbol, contract->venue}, contract->gateway);
        }
    } catch (const std::exception& e) {
        writeLog(std::string("initialization aborted: ") + e.what(), &strategy,
                 LogEvent::Level::Error, ErrorCode::StrategyCallbackFault);
        failInit(strategy);
        return;
    } catch (...) {
        writeLog("initialization aborted: non-standard exception", &strategy,
                 LogEvent::Level::Error, ErrorCode::StrategyCallbackFault);
        failInit(strategy);
        return;
    }

    // Once initialized is visible the control thread may run hooks on this
    // instance, so its state is copied out first.
    StrategySnapshot snap = strategy.snapshot();
    snap.state = StrategyState::Initialized;
    snap.initialized = true;
    snap.trading = false;

    strategy.setStopped(false);
    strategy.setInitialized(true);
    strategy.setInitializing(false);
    emitSnapshot(snap);
    writeLog("initialization complete", &strategy);
}

void StrategyEngine::failInit(StrategyTemplate& strategy) {
    strategy.setTrading(false);
    strategy.setInitialized(false);
    strategy.setInitializing(false);
    putStrategyEvent(strategy);
    writeLog("initialization failed", &strategy, LogEvent::Level::Warn);
}

bool StrategyEngine::startStrategy(const std::string& name) {
    StrategyTemplate* s = lookup(name, "start");
    if (!s) return false;

    if (!s->isInitialized()) {
        writeLog("start rejected, initialize first", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }
    if (s->isTrading()) {
        writeLog("start rejected, already trading", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }

    if (!callStrategyFunc(*s, "onStart", [s] { s->onStart(); })) {
        return false;
    }
    s->setStopped(false);
    s->setTrading(true);
    putStrategyEvent(*s);
    return true;
}

bool StrategyEngine::stopStrategy(const std::string& name) {
    StrategyTemplate* s = lookup(name, "stop");
    if (!s) return false;

    if (!s->isTrading()) {
        writeLog("stop ignored, not trading", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }

    // a faulting stop hook does not prevent the rest of the shutdown
    callStrategyFunc(*s, "onStop", [s] { s->onStop(); });
    s->setTrading(false);
    s->setStopped(true);

    for (const auto& orderId : s->activeOrderIds()) {
        cancelOrder(*s, orderId);
    }
    syncStrategyData(*s);
    putStrategyEvent(*s);
    return true;
}

bool StrategyEngine::editStrategy(const std::string& name, const ValueMap& setting) {
    StrategyTemplate* s = lookup(name, "edit");
    if (!s) return false;

    if (s->isTrading()) {
        writeLog("edit rejected, stop the strategy first", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }
    s->updateSetting(setting);
    saveStrategySetting();
    putStrategyEvent(*s);
    return true;
}

bool StrategyEngine::removeStrategy(const std::string& name) {
    StrategyTemplate* s = lookup(name, "remove");
    if (!s) return false;

    if (s->isTrading() || s->isInitializing()) {
        writeLog("remove rejected, strategy is busy, stop it first", s,
                 LogEvent::Level::Warn, ErrorCode::InvalidLifecycleTransition);
        return false;
    }
    registry_.remove(name);
    saveStrategySetting();
    writeLog("strategy removed: " + name);
    return true;
}

void StrategyEngine::initAllStrategies() {
    for (const auto& name : registry_.names()) initStrategy(name);
}

void StrategyEngine::startAllStrategies() {
    for (const auto& name : registry_.names()) startStrategy(name);
}

void StrategyEngine::stopAllStrategies() {
    for (StrategyTemplate* s : registry_.all()) {
        if (s->isTrading()) stopStrategy(s->name());
    }
}

// ---------------------- Fault isolation ----------------------

bool StrategyEngine::callStrategyFunc(StrategyTemplate& strategy, const char* hook, const std::function<void()>& fn) {
    std::string error;
    try {
        fn();
        return true;
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "non-standard exception";
    }

    strategy.recordFault();
    writeLog(std::string(hook) + " raised, strategy stopped: " + error, &strategy,
             LogEvent::Level::Error, ErrorCode::StrategyCallbackFault);
    putStrategyEvent(strategy);
    return false;
}

// ---------------------- Persistence / notification ----------------------

void StrategyEngine::loadStrategySetting() {
    StrategySettingMap settings;
    if (!store_.loadSettings(settings)) {
        writeLog("strategy settings unreadable, starting with an empty roster", nullptr,
                 LogEvent::Level::Error, ErrorCode::PersistenceFailure);
        return;
    }
    for (const auto& [name, s] : settings) {
        addStrategyImpl(s.className, name, s.instruments, s.setting, false);
    }
}

void StrategyEngine::saveStrategySetting() {
    StrategySettingMap settings;
    for (const StrategyTemplate* s : registry_.all()) {
        settings[s->name()] = StrategySetting{s->className(), s->instruments(), s->parameters()};
    }
    if (!store_.saveSettings(settings)) {
        writeLog("saving strategy settings failed", nullptr,
                 LogEvent::Level::Error, ErrorCode::PersistenceFailure);
    }
}

void StrategyEngine::loadStrategyData() {
    StrategyDataMap data;
    if (!store_.loadData(data)) {
        writeLog("strategy data unreadable, warm restart skipped", nullptr,
                 LogEvent::Level::Error, ErrorCode::PersistenceFailure);
    }
    std::lock_guard<std::mutex> lock(dataMutex_);
    strategyData_ = std::move(data);
}

void StrategyEngine::syncStrategyData(const StrategyTemplate& strategy) {
    StrategyDataMap snapshot;
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        strategyData_[strategy.name()] = strategy.data();
        snapshot = strategyData_;
    }
    if (!store_.saveData(snapshot)) {
        writeLog("saving strategy data failed", &strategy,
                 LogEvent::Level::Error, ErrorCode::PersistenceFailure);
    }
}

void StrategyEngine::putStrategyEvent(const StrategyTemplate& strategy) {
    if (sink_) emitSnapshot(strategy.snapshot());
}

void StrategyEngine::emitSnapshot(const StrategySnapshot& snap) {
    if (!sink_) return;
    try {
        sink_->onStrategyUpdate(snap);
    } catch (const std::exception& e) {
        logger_->error("{}: event sink rejected strategy update: {}", snap.name, e.what());
    }
}

void StrategyEngine::writeLog(const std::string& msg,
                              const StrategyTemplate* strategy,
                              LogEvent::Level level,
                              std::optional<ErrorCode> code) const {
    const std::string text = strategy ? strategy->name() + ": " + msg : msg;
    const char* tag = code ? toString(*code) : "";
    switch (level) {
        case LogEvent::Level::Info:
            logger_->info("{}", text);
            break;
        case LogEvent::Level::Warn:
            logger_->warn("[{}] {}", tag, text);
            break;
        case LogEvent::Level::Error:
            logger_->error("[{}] {}", tag, text);
            break;
    }
    if (!sink_) return;
    try {
        sink_->onLog(LogEvent{level, strategy ? strategy->name() : std::string(), msg, code});
    } catch (const std::exception& e) {
        logger_->error("event sink rejected log event: {}", e.what());
    }
}

// ---------------------- Queries ----------------------

std::optional<ValueMap> StrategyEngine::strategyClassParameters(const std::string& className) {
    if (!factory_.contains(className)) return std::nullopt;
    try {
        auto probe = factory_.create(className, *this, className, {}, {});
        if (!probe) return std::nullopt;
        return probe->parameters();
    } catch (const std::exception& e) {
        writeLog("class " + className + " cannot report defaults: " + e.what(), nullptr, LogEvent::Level::Warn);
        return std::nullopt;
    }
}

std::optional<ValueMap> StrategyEngine::strategyParameters(const std::string& name) const {
    const StrategyTemplate* s = registry_.find(name);
    if (!s) return std::nullopt;
    return s->parameters();
}

std::optional<StrategySnapshot> StrategyEngine::strategySnapshot(const std::string& name) const {
    const StrategyTemplate* s = registry_.find(name);
    if (!s) return std::nullopt;
    return s->snapshot();
}

StrategyTemplate* StrategyEngine::lookup(const std::string& name, const char* action) const {
    StrategyTemplate* s = registry_.find(name);
    if (!s) {
        writeLog(std::string(action) + " failed, strategy not found: " + name, nullptr,
                 LogEvent::Level::Warn, ErrorCode::UnknownStrategy);
    }
    return s;
}

} // namespace pstrat::core
