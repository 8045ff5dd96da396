#pragma once

#include "pstrat/core/strategy_factory.hpp"

namespace pstrat::strategies {

// Registers every strategy class shipped with the project. False when a
// class name was already taken.
bool registerBuiltinStrategies(core::StrategyFactory& factory);

} // namespace pstrat::strategies
