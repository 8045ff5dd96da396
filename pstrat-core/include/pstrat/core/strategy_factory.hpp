#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "pstrat/core/strategy.hpp"
#include "pstrat/core/values.hpp"

namespace pstrat::core {

class StrategyEngine; // fwd

// Explicit class registry, populated at startup by registration calls.
class StrategyFactory {
public:
    using Creator = std::function<std::unique_ptr<StrategyTemplate>(StrategyEngine& engine,
                                                                    const std::string& name,
                                                                    const std::vector<std::string>& instruments)>;

    // Fails on an empty name, an empty creator or a name already taken
    bool registerClass(const std::string& className, Creator creator);

    template <typename T>
    bool registerClass(const std::string& className) {
        return registerClass(className, [](StrategyEngine& engine,
                                           const std::string& name,
                                           const std::vector<std::string>& instruments) {
            return std::unique_ptr<StrategyTemplate>(new T(engine, name, instruments));
        });
    }

    // Constructs and applies the setting; nullptr for an unknown class
    std::unique_ptr<StrategyTemplate> create(const std::string& className,
                                             StrategyEngine& engine,
                                             const std::string& name,
                                             const std::vector<std::string>& instruments,
                                             const ValueMap& setting) const;

    bool contains(const std::string& className) const noexcept { return creators_.count(className) != 0; }
    std::vector<std::string> classNames() const;

private:
    std::map<std::string, Creator> creators_{};
};

} // namespace pstrat::core
