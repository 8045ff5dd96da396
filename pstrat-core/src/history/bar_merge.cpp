#include "pstrat/core/history/bar_merge.hpp"

#include <set>
#include <unordered_map>

namespace pstrat::core::history {

BarData flatBar(const BarData& previous, std::uint64_t tsNs) {
    BarData bar{};
    bar.instrument = previous.instrument;
    bar.gateway = previous.gateway;
    bar.interval = previous.interval;
    bar.tsNs = tsNs;
    bar.open = previous.close;
    bar.high = previous.close;
    bar.low = previous.close;
    bar.close = previous.close;
    return bar;
}

std::vector<BarMap> mergeBars(const std::vector<std::string>& instruments,
                              const std::map<std::string, std::vector<BarData>>& series) {
    std::set<std::uint64_t> timestamps;
    // (instrument -> ts -> bar) index for O(log n) lookups per slot
    std::unordered_map<std::string, std::map<std::uint64_t, const BarData*>> byTs;
    for (const auto& instrument : instruments) {
        auto it = series.find(instrument);
        if (it == series.end()) continue;
        auto& index = byTs[instrument];
        for (const auto& bar : it->second) {
            timestamps.insert(bar.tsNs);
            index[bar.tsNs] = &bar;
        }
    }

    std::vector<BarMap> out;
    out.reserve(timestamps.size());
    BarMap current;
    for (const std::uint64_t ts : timestamps) {
        for (const auto& instrument : instruments) {
            const BarData* bar = nullptr;
            auto idx = byTs.find(instrument);
            if (idx != byTs.end()) {
                auto hit = idx->second.find(ts);
                if (hit != idx->second.end()) bar = hit->second;
            }
            if (bar) {
                current[instrument] = *bar;
            } else {
                auto prev = current.find(instrument);
                if (prev != current.end()) {
                    prev->second = flatBar(prev->second, ts);
                }
            }
        }
        out.push_back(current);
    }
    return out;
}

} // namespace pstrat::core::history
