#pragma once

#include <string>
#include <vector>

#include "pstrat/core/market_data.hpp"

namespace pstrat::core::history {

// Historical bar provider (paid data service or local store).
// Bars are returned in ascending time order; empty on miss or failure.
class HistorySource {
public:
    virtual ~HistorySource() = default;
    virtual std::vector<BarData> queryBars(const HistoryRequest& req) = 0;
    virtual std::string name() const = 0;
};

} // namespace pstrat::core::history
