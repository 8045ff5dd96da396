#include "pstrat/core/strategy_factory.hpp"

#include <utility>

namespace pstrat::core {

bool StrategyFactory::registerClass(const std::string& className, Creator creator) {
    if (className.empty() || !creator) return false;
    return creators_.emplace(className, std::move(creator)).second;
}

std::unique_ptr<StrategyTemplate> StrategyFactory::create(const std::string& className,
                                                          StrategyEngine& engine,
                                                          const std::string& name,
                                                          const std::vector<std::string>& instruments,
                                                          const ValueMap& setting) const {
    auto it = creators_.find(className);
    if (it == creators_.end()) return nullptr;
    auto strategy = it->second(engine, name, instruments);
    if (strategy) strategy->updateSetting(setting);
    return strategy;
}

std::vector<std::string> StrategyFactory::classNames() const {
    std::vector<std::string> out;
    out.reserve(creators_.size());
    for (const auto& [name, creator] : creators_) out.push_back(name);
    return out;
}

} // namespace pstrat::core
