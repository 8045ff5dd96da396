#pragma once

#include <string>

#include "pstrat/core/trade.hpp"
#include "pstrat/core/values.hpp"

namespace pstrat::core {

// Actual and target net position per instrument, in signed lots.
// Reads default to zero on miss; reads never insert.
class PositionLedger {
public:
    int position(const std::string& instrument) const noexcept;
    int target(const std::string& instrument) const noexcept;

    void setTarget(const std::string& instrument, int target);

    // Net position moves by the signed fill volume; offset is ignored.
    void applyFill(const TradeData& trade);

    // Warm-restart merge: listed instruments are overwritten, others kept
    void mergePositions(const PositionMap& positions);
    void mergeTargets(const PositionMap& targets);

    const PositionMap& positions() const noexcept { return positions_; }
    const PositionMap& targets() const noexcept { return targets_; }

private:
    PositionMap positions_{};
    PositionMap targets_{};
};

} // namespace pstrat::core
