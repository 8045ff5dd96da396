#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pstrat/core/strategy.hpp"

namespace pstrat::core {

// Set of applied trade ids. retention == 0 keeps every id for the life of
// the process; otherwise the oldest ids are evicted first.
class TradeIdFilter {
public:
    explicit TradeIdFilter(std::size_t retention = 0) : retention_(retention) {}

    // Returns true the first time an id is seen, false for duplicates
    bool insert(const std::string& tradeId);
    bool contains(const std::string& tradeId) const noexcept { return seen_.count(tradeId) != 0; }

    std::size_t size() const noexcept { return seen_.size(); }
    std::size_t retention() const noexcept { return retention_; }

private:
    std::size_t retention_{};
    std::unordered_set<std::string> seen_{};
    std::deque<std::string> order_{};
};

// Owns the strategy instances and the non-owning lookup indices over them.
class StrategyRegistry {
public:
    explicit StrategyRegistry(std::size_t tradeIdRetention = 0);

    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    // Fails when the name is already taken
    bool add(std::unique_ptr<StrategyTemplate> strategy);

    // Drops the instance together with its instrument and order-id entries
    bool remove(const std::string& name);

    StrategyTemplate* find(const std::string& name) const noexcept;
    bool contains(const std::string& name) const noexcept { return find(name) != nullptr; }

    // Subscription order; empty when nothing trades the instrument
    const std::vector<StrategyTemplate*>& strategiesFor(const std::string& instrument) const noexcept;

    void bindOrder(const std::string& orderId, StrategyTemplate& strategy);
    StrategyTemplate* strategyForOrder(const std::string& orderId) const noexcept;

    bool markTradeSeen(const std::string& tradeId) { return seenTrades_.insert(tradeId); }
    const TradeIdFilter& seenTrades() const noexcept { return seenTrades_; }

    std::vector<std::string> names() const;
    std::vector<StrategyTemplate*> all() const;
    std::size_t size() const noexcept { return strategies_.size(); }
    std::size_t orderBindingCount() const noexcept { return byOrderId_.size(); }

private:
    std::map<std::string, std::unique_ptr<StrategyTemplate>> strategies_{};
    std::unordered_map<std::string, std::vector<StrategyTemplate*>> byInstrument_{};
    std::unordered_map<std::string, StrategyTemplate*> byOrderId_{};
    TradeIdFilter seenTrades_;
};

} // namespace pstrat::core
