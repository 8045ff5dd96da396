#include "pstrat/core/strategy_registry.hpp"

#include <algorithm>
#include <utility>

namespace pstrat::core {

bool TradeIdFilter::insert(const std::string& tradeId) {
    if (!seen_.insert(tradeId).second) return false;
    if (retention_ == 0) return true;
    order_.push_back(tradeId);
    while (order_.size() > retention_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

StrategyRegistry::StrategyRegistry(std::size_t tradeIdRetention)
    : seenTrades_(tradeIdRetention) {}

bool StrategyRegistry::add(std::unique_ptr<StrategyTemplate> strategy) {
    if (!strategy) return false;
    const std::string name = strategy->name();
    if (strategies_.count(name)) return false;

    StrategyTemplate* raw = strategy.get();
    strategies_.emplace(name, std::move(strategy));
    for (const auto& instrument : raw->instruments()) {
        auto& list = byInstrument_[instrument];
        if (std::find(list.begin(), list.end(), raw) == list.end()) {
            list.push_back(raw);
        }
    }
    return true;
}

bool StrategyRegistry::remove(const std::string& name) {
    auto it = strategies_.find(name);
    if (it == strategies_.end()) return false;
    StrategyTemplate* raw = it->second.get();

    for (const auto& instrument : raw->instruments()) {
        auto lit = byInstrument_.find(instrument);
        if (lit == byInstrument_.end()) continue;
        auto& list = lit->second;
        list.erase(std::remove(list.begin(), list.end(), raw), list.end());
        if (list.empty()) byInstrument_.erase(lit);
    }
    for (auto oit = byOrderId_.begin(); oit != byOrderId_.end();) {
        if (oit->second == raw) {
            oit = byOrderId_.erase(oit);
        } else {
            ++oit;
        }
    }
    strategies_.erase(it);
    return true;
}

StrategyTemplate* StrategyRegistry::find(const std::string& name) const noexcept {
    auto it = strategies_.find(name);
    return it == strategies_.end() ? nullptr : it->second.get();
}

const std::vector<StrategyTemplate*>& StrategyRegistry::strategiesFor(const std::string& instrument) const noexcept {
    static const std::vector<StrategyTemplate*> kEmpty{};
    auto it = byInstrument_.find(instrument);
    return it == byInstrument_.end() ? kEmpty : it->second;
}

void StrategyRegistry::bindOrder(const std::string& orderId, StrategyTemplate& strategy) {
    byOrderId_[orderId] = &strategy;
}

StrategyTemplate* StrategyRegistry::strategyForOrder(const std::string& orderId) const noexcept {
    auto it = byOrderId_.find(orderId);
    return it == byOrderId_.end() ? nullptr : it->second;
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(strategies_.size());
    for (const auto& [name, s] : strategies_) out.push_back(name);
    return out;
}

std::vector<StrategyTemplate*> StrategyRegistry::all() const {
    std::vector<StrategyTemplate*> out;
    out.reserve(strategies_.size());
    for (const auto& [name, s] : strategies_) out.push_back(s.get());
    return out;
}

} // namespace pstrat::core
