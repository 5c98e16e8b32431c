#include "delivery_gate.hpp"
#include <algorithm>
#include <iterator>
#include <vector>

namespace fanout {

namespace {

// Gates held by the current thread, innermost last. Nesting depth is the
// number of channels a delivery chain passes through, so a vector is enough.
thread_local std::vector<const DeliveryGate*> t_held_gates;

} // namespace

bool DeliveryGate::held_by_current_thread() const {
    return std::find(t_held_gates.begin(), t_held_gates.end(), this) !=
           t_held_gates.end();
}

DeliveryGate::Holder::Holder(const DeliveryGate& gate) : gate_(gate) {
    t_held_gates.push_back(&gate_);
}

DeliveryGate::Holder::~Holder() {
    auto it = std::find(t_held_gates.rbegin(), t_held_gates.rend(), &gate_);
    if (it != t_held_gates.rend()) {
        t_held_gates.erase(std::next(it).base());
    }
}

} // namespace fanout
