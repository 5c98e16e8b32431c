#pragma once
#include "delivery_gate.hpp"
#include "history.hpp"
#include "listener_registry.hpp"
#include "strategy.hpp"
#include "subscription.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace fanout {

namespace detail {

// Shared state behind an Emitter/Channel pair.
//
// mutex_ guards the registry and the history and is only held while they are
// mutated or copied. gate_ serializes delivery: broadcasts and replaying
// listens on one channel never interleave, and handlers always run with gate_
// held and mutex_ released. A listen with nothing to replay only takes mutex_.
template<typename V>
class ChannelCore : public ListenerHost,
                    public std::enable_shared_from_this<ChannelCore<V>> {
public:
    using Handler = std::function<void(const V&)>;

    explicit ChannelCore(Strategy strategy)
        : strategy_(strategy), history_(strategy) {}

    void append(const V& value) {
        gate_.run([&] {
            std::vector<std::shared_ptr<Handler>> handlers;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                history_.append(value);
                handlers = listeners_.snapshot();
            }
            for (const auto& handler : handlers) {
                (*handler)(value);
            }
        });
    }

    Subscription listen(Handler handler) {
        auto shared = std::make_shared<Handler>(std::move(handler));
        ListenerToken token = 0;
        if (!strategy_.retains()) {
            // Nothing to replay, so no ordering against deliveries to keep
            std::lock_guard<std::mutex> lock(mutex_);
            token = listeners_.insert(shared);
            return Subscription(this->weak_from_this(), token);
        }
        gate_.run([&] {
            std::vector<V> replay;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                token = listeners_.insert(shared);
                replay = history_.snapshot();
            }
            for (const auto& value : replay) {
                (*shared)(value);
            }
        });
        return Subscription(this->weak_from_this(), token);
    }

    void remove_listener(ListenerToken token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.remove(token);
    }

    const Strategy& strategy() const { return strategy_; }

    size_t listener_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    size_t buffered_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.size();
    }

private:
    const Strategy strategy_;
    mutable std::mutex mutex_;
    HistoryBuffer<V> history_;
    ListenerRegistry<Handler> listeners_;
    DeliveryGate gate_;
};

} // namespace detail

// Read side of a channel. Copies refer to the same channel and keep it alive.
//
// listen() registers a handler and, depending on the strategy, replays the
// retained values to that handler only before returning. Handlers run on the
// thread that broadcasts (or, for replay, the thread calling listen) and may
// themselves listen, dispose or broadcast on the same channel.
template<typename V>
class Channel {
public:
    using Handler = std::function<void(const V&)>;

    // Use make_channel() to create a channel.
    explicit Channel(std::shared_ptr<detail::ChannelCore<V>> core)
        : core_(std::move(core)) {}

    Subscription listen(Handler handler) const {
        auto core = core_; // a handler may drop the last owner during replay
        return core->listen(std::move(handler));
    }

    const Strategy& strategy() const { return core_->strategy(); }

    // Diagnostics
    size_t listener_count() const { return core_->listener_count(); }
    size_t buffered_count() const { return core_->buffered_count(); }

private:
    std::shared_ptr<detail::ChannelCore<V>> core_;
};

// Write side of a channel. Holds the channel strongly; the channel never
// refers back to its emitter.
template<typename V>
class Emitter {
public:
    explicit Emitter(std::shared_ptr<detail::ChannelCore<V>> core)
        : core_(std::move(core)) {}

    // Record the value per the channel strategy and deliver it to every
    // listener registered at this point.
    void broadcast(const V& value) const {
        auto core = core_; // a handler may drop the last owner mid-delivery
        core->append(value);
    }

private:
    std::shared_ptr<detail::ChannelCore<V>> core_;
};

// Create a bound Emitter/Channel pair.
template<typename V>
std::pair<Emitter<V>, Channel<V>> make_channel(Strategy strategy = Strategy::none()) {
    auto core = std::make_shared<detail::ChannelCore<V>>(strategy);
    return {Emitter<V>(core), Channel<V>(core)};
}

} // namespace fanout
