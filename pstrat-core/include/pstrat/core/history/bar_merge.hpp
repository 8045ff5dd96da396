#pragma once

#include <map>
#include <string>
#include <vector>

#include "pstrat/core/market_data.hpp"

namespace pstrat::core::history {

// Merges per-instrument bar series into one ascending timeline.
// Each returned BarMap holds every instrument that has produced data at or
// before that timestamp; an instrument missing at a timestamp is filled with
// a flat bar at its previous close (open=high=low=close, volume 0).
std::vector<BarMap> mergeBars(const std::vector<std::string>& instruments,
                              const std::map<std::string, std::vector<BarData>>& series);

BarData flatBar(const BarData& previous, std::uint64_t tsNs);

} // namespace pstrat::core::history
