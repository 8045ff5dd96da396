#include "pstrat/core/parameters.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace pstrat::core {

namespace {

template <typename T>
bool convert(const Value& value, T& out) {
    if constexpr (std::is_same_v<T, int>) {
        constexpr auto lo = std::numeric_limits<int>::min();
        constexpr auto hi = std::numeric_limits<int>::max();
        if (const auto* i = std::get_if<std::int64_t>(&value)) {
            if (*i < lo || *i > hi) return false;
            out = static_cast<int>(*i);
            return true;
        }
        if (const auto* d = std::get_if<double>(&value)) {
            const double r = std::round(*d);
            if (!std::isfinite(r) || r < lo || r > hi) return false;
            out = static_cast<int>(r);
            return true;
        }
        return false;
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto* d = std::get_if<double>(&value)) { out = *d; return true; }
        if (const auto* i = std::get_if<std::int64_t>(&value)) { out = static_cast<double>(*i); return true; }
        return false;
    } else {
        if (const auto* v = std::get_if<T>(&value)) { out = *v; return true; }
        return false;
    }
}

} // namespace

void ParameterSet::add(const std::string& name, Ref ref) {
    for (auto& b : bindings_) {
        if (b.name == name) { b.ref = ref; return; }
    }
    bindings_.push_back(Binding{name, ref});
}

const ParameterSet::Binding* ParameterSet::find(const std::string& name) const noexcept {
    for (const auto& b : bindings_) {
        if (b.name == name) return &b;
    }
    return nullptr;
}

bool ParameterSet::contains(const std::string& name) const noexcept {
    return find(name) != nullptr;
}

std::vector<std::string> ParameterSet::names() const {
    std::vector<std::string> out;
    out.reserve(bindings_.size());
    for (const auto& b : bindings_) out.push_back(b.name);
    return out;
}

ValueMap ParameterSet::values() const {
    ValueMap out;
    for (const auto& b : bindings_) {
        std::visit([&out, &b](auto* p) {
            using T = std::remove_pointer_t<decltype(p)>;
            if constexpr (std::is_same_v<T, int>) {
                out[b.name] = static_cast<std::int64_t>(*p);
            } else {
                out[b.name] = *p;
            }
        }, b.ref);
    }
    return out;
}

bool ParameterSet::assign(const std::string& name, const Value& value) {
    const Binding* b = find(name);
    if (!b) return false;
    return std::visit([&value](auto* p) { return convert(value, *p); }, b->ref);
}

} // namespace pstrat::core
