#pragma once
#include "listener_registry.hpp"
#include <atomic>
#include <memory>

namespace fanout {

class DisposeBag;

// Anything a Subscription can detach a listener from.
class ListenerHost {
public:
    virtual ~ListenerHost() = default;
    virtual void remove_listener(ListenerToken token) = 0;
};

// Handle returned by Channel::listen().
//
// Holds only a weak reference to the channel, so it never keeps the channel
// alive; disposing after the channel is gone does nothing. Copies share one
// disposal state and only the first dispose() has an effect.
//
// Dropping a Subscription does not detach the listener. Use dispose() or a
// DisposeBag for that.
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<ListenerHost> host, ListenerToken token);

    void dispose();

    // True once dispose() has run on this handle or a copy of it.
    // Always true for a default-constructed handle.
    bool disposed() const;

    // Hand the subscription to a bag; it is disposed together with the bag.
    void disposed_by(DisposeBag& bag) const;

private:
    struct State {
        std::weak_ptr<ListenerHost> host;
        ListenerToken token = 0;
        std::atomic<bool> disposed{false};
    };

    std::shared_ptr<State> state_;
};

} // namespace fanout
