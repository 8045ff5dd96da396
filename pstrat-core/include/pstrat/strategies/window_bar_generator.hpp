#pragma once

#include <optional>

#include "pstrat/core/market_data.hpp"

namespace pstrat::strategies {

// Folds minute slices of a whole portfolio into hour bars, and hour bars
// into bars spanning `hours` hours. An hour closes on its minute-59 slice;
// a window closes on the hour h where (h + 1) % hours == 0 (UTC).
class WindowBarGenerator {
public:
    explicit WindowBarGenerator(int hours);

    // Returns the finished window slice, if this minute slice closed one
    std::optional<core::BarMap> updateBars(const core::BarMap& minuteBars);

private:
    int hours_;
    core::BarMap hourBars_{};
    core::BarMap windowBars_{};
};

} // namespace pstrat::strategies
