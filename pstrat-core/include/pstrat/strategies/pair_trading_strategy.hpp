#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "pstrat/core/strategy.hpp"
#include "pstrat/strategies/bar_generator.hpp"

namespace pstrat::strategies {

// Mean-reversion on the spread of two legs. Every fifth minute bar the
// spread is pushed into a rolling window; a Bollinger band break opens a
// hedged position of fixed_size lots, a cross of the mid flattens it.
class PairTradingStrategy : public core::StrategyTemplate {
public:
    static constexpr const char* kClassName = "PairTradingStrategy";

    PairTradingStrategy(core::StrategyEngine& engine,
                        std::string name,
                        std::vector<std::string> instruments);

    std::string className() const override { return kClassName; }
    std::string author() const override { return "pstrat"; }

    void onInit() override;
    void onStart() override;
    void onStop() override;
    void onTick(const core::TickData& tick) override;
    void onBars(const core::BarMap& bars) override;

protected:
    double calculatePrice(const std::string& instrument, core::Direction direction, double reference) override;

private:
    void updateBand();

    // parameters
    int tickAdd_{1};
    int bollWindow_{20};
    double bollDev_{2.0};
    int fixedSize_{1};
    int leg1Ratio_{1};
    int leg2Ratio_{1};

    // variables
    std::string leg1Symbol_{};
    std::string leg2Symbol_{};
    double currentSpread_{0.0};
    double bollMid_{0.0};
    double bollDown_{0.0};
    double bollUp_{0.0};

    std::map<std::string, BarGenerator> generators_{};
    std::uint64_t lastTickMinute_{0};
    bool hasLastTick_{false};
    int spreadCount_{0};
    std::deque<double> spreadData_{};
};

} // namespace pstrat::strategies
