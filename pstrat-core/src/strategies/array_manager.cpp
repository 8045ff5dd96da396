#include "pstrat/strategies/array_manager.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace pstrat::strategies {

namespace {

bool usable(int n, std::size_t available) {
    return n > 0 && static_cast<std::size_t>(n) <= available;
}

} // namespace

ArrayManager::ArrayManager(std::size_t size) : size_(std::max<std::size_t>(size, 1)) {}

void ArrayManager::updateBar(const core::BarData& bar) {
    high_.push_back(bar.high);
    low_.push_back(bar.low);
    close_.push_back(bar.close);
    if (close_.size() > size_) {
        high_.pop_front();
        low_.pop_front();
        close_.pop_front();
    }
    ++count_;
}

double ArrayManager::sma(int n) const {
    if (!usable(n, close_.size())) return 0.0;
    const auto first = close_.end() - n;
    return std::accumulate(first, close_.end(), 0.0) / n;
}

double ArrayManager::stddev(int n) const {
    if (!usable(n, close_.size())) return 0.0;
    const double mean = sma(n);
    double variance = 0.0;
    for (auto it = close_.end() - n; it != close_.end(); ++it) {
        variance += (*it - mean) * (*it - mean);
    }
    return std::sqrt(variance / n);
}

std::pair<double, double> ArrayManager::boll(int n, double dev) const {
    const double mid = sma(n);
    const double sd = stddev(n);
    return {mid + dev * sd, mid - dev * sd};
}

double ArrayManager::cci(int n) const {
    if (!usable(n, close_.size())) return 0.0;
    std::vector<double> typical;
    typical.reserve(static_cast<std::size_t>(n));
    for (std::size_t i = close_.size() - n; i < close_.size(); ++i) {
        typical.push_back((high_[i] + low_[i] + close_[i]) / 3.0);
    }
    const double mean = std::accumulate(typical.begin(), typical.end(), 0.0) / n;
    double meanDev = 0.0;
    for (double tp : typical) meanDev += std::fabs(tp - mean);
    meanDev /= n;
    if (meanDev == 0.0) return 0.0;
    return (typical.back() - mean) / (0.015 * meanDev);
}

double ArrayManager::atr(int n) const {
    // true range needs the previous close, so n ranges take n + 1 bars
    if (n <= 0 || static_cast<std::size_t>(n) + 1 > close_.size()) return 0.0;

    std::vector<double> ranges;
    ranges.reserve(close_.size() - 1);
    for (std::size_t i = 1; i < close_.size(); ++i) {
        const double prev = close_[i - 1];
        ranges.push_back(std::max({high_[i] - low_[i], std::fabs(high_[i] - prev), std::fabs(low_[i] - prev)}));
    }

    double value = std::accumulate(ranges.begin(), ranges.begin() + n, 0.0) / n;
    for (std::size_t i = static_cast<std::size_t>(n); i < ranges.size(); ++i) {
        value = (value * (n - 1) + ranges[i]) / n;
    }
    return value;
}

} // namespace pstrat::strategies
