#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pstrat/core/values.hpp"

namespace pstrat::core {

// Named bindings onto strategy members, in declaration order.
// Used for both parameters (settable) and reported variables.
class ParameterSet {
public:
    using Ref = std::variant<int*, double*, std::string*, bool*>;

    void bind(const std::string& name, int& member) { add(name, &member); }
    void bind(const std::string& name, double& member) { add(name, &member); }
    void bind(const std::string& name, std::string& member) { add(name, &member); }
    void bind(const std::string& name, bool& member) { add(name, &member); }

    bool contains(const std::string& name) const noexcept;
    std::vector<std::string> names() const;

    ValueMap values() const;

    // Assigns a value to a bound member. int<->double are converted; any
    // other kind mismatch leaves the member untouched and returns false.
    bool assign(const std::string& name, const Value& value);

private:
    struct Binding {
        std::string name;
        Ref ref;
    };

    void add(const std::string& name, Ref ref);
    const Binding* find(const std::string& name) const noexcept;

    std::vector<Binding> bindings_{};
};

} // namespace pstrat::core
