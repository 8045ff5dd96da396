#include "pstrat/core/order_book.hpp"

namespace pstrat::core {

void OrderBook::reset() {
    orders_.clear();
    active_.clear();
}

void OrderBook::track(const std::string& orderId) {
    if (orderId.empty()) return;
    auto it = orders_.find(orderId);
    if (it != orders_.end() && !it->second.isActive()) return;
    active_.insert(orderId);
}

bool OrderBook::update(const OrderData& order) {
    orders_[order.orderId] = order;
    if (order.isActive()) return false;
    return active_.erase(order.orderId) > 0;
}

bool OrderBook::isActive(const std::string& orderId) const noexcept {
    return active_.find(orderId) != active_.end();
}

const OrderData* OrderBook::find(const std::string& orderId) const noexcept {
    auto it = orders_.find(orderId);
    if (it == orders_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> OrderBook::activeIds() const {
    return {active_.begin(), active_.end()};
}

} // namespace pstrat::core
