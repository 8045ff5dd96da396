#pragma once

#include "pstrat/core/order.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace pstrat::core {

// Per-strategy record of submitted orders and the subset still working.
class OrderBook {
public:
    // Mark a freshly submitted id as active. An id whose terminal status
    // was already observed is not re-activated.
    void track(const std::string& orderId);

    // Record the latest snapshot. Returns true when this update retired
    // the id from the active set (terminal status seen for the first time).
    bool update(const OrderData& order);

    bool isActive(const std::string& orderId) const noexcept;
    const OrderData* find(const std::string& orderId) const noexcept;

    std::vector<std::string> activeIds() const;
    std::size_t activeCount() const noexcept { return active_.size(); }
    std::size_t orderCount() const noexcept { return orders_.size(); }

    void reset();

private:
    std::unordered_map<std::string, OrderData> orders_{};
    std::set<std::string> active_{};
};

} // namespace pstrat::core
