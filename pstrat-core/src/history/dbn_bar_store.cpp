#include "pstrat/core/history/dbn_bar_store.hpp"
#include "pstrat/core/history/dbn_bar_reader.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace pstrat::core::history {

DbnBarStore::DbnBarStore(std::string directory, std::shared_ptr<spdlog::logger> logger)
    : directory_(std::move(directory)), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::string DbnBarStore::pathFor(const std::string& instrument, Interval interval) const {
    namespace fs = std::filesystem;
    const fs::path base = fs::path(directory_) / (instrument + "." + toString(interval) + ".dbn");
    std::error_code ec;
    if (fs::exists(base, ec)) return base.string();
    fs::path zst = base;
    zst += ".zst";
    if (fs::exists(zst, ec)) return zst.string();
    return {};
}

std::vector<BarData> DbnBarStore::queryBars(const HistoryRequest& req) {
    std::vector<BarData> bars;
    const std::string path = pathFor(req.instrument, req.interval);
    if (path.empty()) return bars;

    DbnBarReader reader;
    if (!reader.open(path, req.startNs, req.endNs)) {
        logger_->warn("failed to open DBN file {}: {}", path, reader.lastError());
        return bars;
    }

    OhlcvBar in{};
    while (reader.nextBar(in)) {
        BarData bar{};
        bar.instrument = req.instrument;
        bar.gateway = "DB";
        bar.tsNs = in.tsNs;
        bar.interval = req.interval;
        bar.open = in.open;
        bar.high = in.high;
        bar.low = in.low;
        bar.close = in.close;
        bar.volume = in.volume;
        bars.push_back(std::move(bar));
    }
    logger_->debug("DBN {} dataset={} bars={} skipped={}", path, reader.dataset(), bars.size(), reader.skipped());
    return bars;
}

} // namespace pstrat::core::history
