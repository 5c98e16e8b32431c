#include "strategy.hpp"
#include "util.hpp"
#include <limits>
#include <stdexcept>

namespace fanout {

bool Strategy::retains() const {
    switch (kind) {
        case Kind::NoBuffering:     return false;
        case Kind::BoundedReplay:   return capacity > 0;
        case Kind::UnboundedReplay: return true;
    }
    return false;
}

size_t Strategy::replay_limit() const {
    switch (kind) {
        case Kind::NoBuffering:     return 0;
        case Kind::BoundedReplay:   return capacity;
        case Kind::UnboundedReplay: return std::numeric_limits<size_t>::max();
    }
    return 0;
}

bool Strategy::operator==(const Strategy& other) const {
    if (kind != other.kind) return false;
    // Capacity carries no meaning outside BoundedReplay
    return kind != Kind::BoundedReplay || capacity == other.capacity;
}

std::string to_string(const Strategy& strategy) {
    switch (strategy.kind) {
        case Strategy::Kind::NoBuffering:
            return "none";
        case Strategy::Kind::BoundedReplay:
            return "bounded(" + std::to_string(strategy.capacity) + ")";
        case Strategy::Kind::UnboundedReplay:
            return "unbounded";
    }
    return "none";
}

Strategy parse_strategy(const std::string& name, size_t capacity) {
    std::string n = to_lower(trim(name));
    if (n == "none" || n == "hot") return Strategy::none();
    if (n == "bounded" || n == "warm") return Strategy::bounded(capacity);
    if (n == "unbounded" || n == "cold") return Strategy::unbounded();
    throw std::invalid_argument("Unknown buffering strategy: " + name);
}

} // namespace fanout
