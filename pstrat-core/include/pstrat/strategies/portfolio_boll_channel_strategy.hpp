#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "pstrat/core/strategy.hpp"
#include "pstrat/strategies/array_manager.hpp"
#include "pstrat/strategies/bar_generator.hpp"
#include "pstrat/strategies/window_bar_generator.hpp"

namespace pstrat::strategies {

// Trend following on two-hour bars, independently per instrument. The CCI
// sign picks the side when flat; entries rest at the Bollinger band, exits
// trail the intra-trade extreme by sl_multiplier ATRs.
class PortfolioBollChannelStrategy : public core::StrategyTemplate {
public:
    static constexpr const char* kClassName = "PortfolioBollChannelStrategy";

    PortfolioBollChannelStrategy(core::StrategyEngine& engine,
                                 std::string name,
                                 std::vector<std::string> instruments);

    std::string className() const override { return kClassName; }
    std::string author() const override { return "pstrat"; }

    void onInit() override;
    void onStart() override;
    void onStop() override;
    void onTick(const core::TickData& tick) override;
    void onBars(const core::BarMap& bars) override;

private:
    void onWindowBars(const core::BarMap& bars);

    // parameters
    int bollWindow_{18};
    double bollDev_{3.4};
    int cciWindow_{10};
    int atrWindow_{30};
    double slMultiplier_{5.2};
    int fixedSize_{1};
    int priceAdd_{5};

    std::map<std::string, ArrayManager> ams_{};
    std::map<std::string, BarGenerator> generators_{};
    WindowBarGenerator windowGenerator_{2};

    std::map<std::string, double> bollUp_{};
    std::map<std::string, double> bollDown_{};
    std::map<std::string, double> intraTradeHigh_{};
    std::map<std::string, double> intraTradeLow_{};

    std::uint64_t lastTickMinute_{0};
    bool hasLastTick_{false};
};

} // namespace pstrat::strategies
