#include "pstrat/core/history/dbn_bar_reader.hpp"

#include <exception>

namespace pstrat::core::history {

namespace {

// DBN prices are fixed-point with 1e-9 precision
constexpr double kPriceScale = 1e-9;

double toPrice(std::int64_t fixed) {
    return static_cast<double>(fixed) * kPriceScale;
}

} // namespace

bool DbnBarReader::open(const std::string& path, std::uint64_t startNs, std::uint64_t endNs) {
    close();
    try {
        store_ = std::make_unique<databento::DbnFileStore>(path);
        dataset_ = store_->GetMetadata().dataset;
    } catch (const std::exception& e) {
        store_.reset();
        lastError_ = e.what();
        return false;
    }
    startNs_ = startNs;
    endNs_ = endNs;
    lastError_.clear();
    return true;
}

void DbnBarReader::close() {
    store_.reset();
    dataset_.clear();
    skipped_ = 0;
}

bool DbnBarReader::nextBar(OhlcvBar& out) {
    if (!store_) return false;
    while (const databento::Record* rec = store_->NextRecord()) {
        const auto* ohlcv = rec->GetIf<databento::OhlcvMsg>();
        if (!ohlcv) {
            ++skipped_;
            continue;
        }
        const auto ts = static_cast<std::uint64_t>(ohlcv->hd.ts_event.time_since_epoch().count());
        if (ts < startNs_) continue;
        if (ts > endNs_) {
            store_.reset();
            return false;
        }
        out.tsNs = ts;
        out.instrumentId = ohlcv->hd.instrument_id;
        out.open = toPrice(ohlcv->open);
        out.high = toPrice(ohlcv->high);
        out.low = toPrice(ohlcv->low);
        out.close = toPrice(ohlcv->close);
        out.volume = static_cast<double>(ohlcv->volume);
        return true;
    }
    store_.reset();
    return false;
}

} // namespace pstrat::core::history
