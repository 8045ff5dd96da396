#include "pstrat/strategies/builtin_strategies.hpp"
#include "pstrat/strategies/pair_trading_strategy.hpp"
#include "pstrat/strategies/portfolio_boll_channel_strategy.hpp"

namespace pstrat::strategies {

bool registerBuiltinStrategies(core::StrategyFactory& factory) {
    bool ok = factory.registerClass<PairTradingStrategy>(PairTradingStrategy::kClassName);
    ok = factory.registerClass<PortfolioBollChannelStrategy>(PortfolioBollChannelStrategy::kClassName) && ok;
    return ok;
}

} // namespace pstrat::strategies
