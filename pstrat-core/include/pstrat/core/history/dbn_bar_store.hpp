#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pstrat/core/history/history_source.hpp"

namespace pstrat::core::history {

// Local bar store over Databento OHLCV files laid out as
// <dir>/<instrument>.<interval>.dbn, optionally zstd-compressed (.dbn.zst).
// Interval tags are the Interval names: 1m, 1h, d.
class DbnBarStore : public HistorySource {
public:
    explicit DbnBarStore(std::string directory,
                         std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    std::vector<BarData> queryBars(const HistoryRequest& req) override;
    std::string name() const override { return "dbn:" + directory_; }

    // Path of the file serving (instrument, interval), empty when none exists
    std::string pathFor(const std::string& instrument, Interval interval) const;

private:
    std::string directory_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pstrat::core::history
