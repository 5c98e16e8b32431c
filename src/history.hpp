#pragma once
#include "strategy.hpp"
#include <deque>
#include <vector>
#include <cstddef>

namespace fanout {

// Ordered record of broadcast values, bounded by the channel strategy.
// Not synchronized; the owning channel guards it with its mutex.
template<typename V>
class HistoryBuffer {
public:
    explicit HistoryBuffer(Strategy strategy) : strategy_(strategy) {}

    void append(const V& value) {
        switch (strategy_.kind) {
            case Strategy::Kind::NoBuffering:
                return;
            case Strategy::Kind::BoundedReplay:
                if (strategy_.capacity == 0) return;
                values_.push_back(value);
                while (values_.size() > strategy_.capacity) {
                    values_.pop_front();
                }
                return;
            case Strategy::Kind::UnboundedReplay:
                values_.push_back(value);
                return;
        }
    }

    // Everything currently retained, oldest first.
    std::vector<V> snapshot() const {
        return std::vector<V>(values_.begin(), values_.end());
    }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const Strategy& strategy() const { return strategy_; }

private:
    Strategy strategy_;
    std::deque<V> values_;
};

} // namespace fanout
