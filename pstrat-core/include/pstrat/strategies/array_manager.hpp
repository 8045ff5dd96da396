#pragma once

#include <cstddef>
#include <deque>
#include <utility>

#include "pstrat/core/market_data.hpp"

namespace pstrat::strategies {

// Rolling OHLC history of one instrument with the indicators the built-in
// strategies need. Indicators are computed over the retained window and
// return 0 until enough bars have been seen.
class ArrayManager {
public:
    explicit ArrayManager(std::size_t size = 100);

    void updateBar(const core::BarData& bar);

    // True once the window is full
    bool inited() const noexcept { return count_ >= size_; }
    std::size_t count() const noexcept { return count_; }

    double sma(int n) const;
    // Population standard deviation of the last n closes
    double stddev(int n) const;
    // (upper, lower) band around the n-bar mean
    std::pair<double, double> boll(int n, double dev) const;
    // Commodity channel index on typical price
    double cci(int n) const;
    // Average true range with Wilder smoothing
    double atr(int n) const;

private:
    std::size_t size_;
    std::size_t count_{0};
    std::deque<double> high_{};
    std::deque<double> low_{};
    std::deque<double> close_{};
};

} // namespace pstrat::strategies
