#include "pstrat/core/position_ledger.hpp"

namespace pstrat::core {

namespace {

int lookup(const PositionMap& m, const std::string& instrument) noexcept {
    auto it = m.find(instrument);
    return it == m.end() ? 0 : it->second;
}

void merge(PositionMap& dst, const PositionMap& src) {
    for (const auto& [instrument, lots] : src) {
        dst[instrument] = lots;
    }
}

} // namespace

int PositionLedger::position(const std::string& instrument) const noexcept {
    return lookup(positions_, instrument);
}

int PositionLedger::target(const std::string& instrument) const noexcept {
    return lookup(targets_, instrument);
}

void PositionLedger::setTarget(const std::string& instrument, int target) {
    targets_[instrument] = target;
}

void PositionLedger::applyFill(const TradeData& trade) {
    positions_[trade.instrument] += trade.signedVolume();
}

void PositionLedger::mergePositions(const PositionMap& positions) { merge(positions_, positions); }
void PositionLedger::mergeTargets(const PositionMap& targets) { merge(targets_, targets); }

} // namespace pstrat::core
