#include "subscription.hpp"
#include "dispose_bag.hpp"

namespace fanout {

Subscription::Subscription(std::weak_ptr<ListenerHost> host, ListenerToken token)
    : state_(std::make_shared<State>())
{
    state_->host = std::move(host);
    state_->token = token;
}

void Subscription::dispose() {
    if (!state_) return;
    if (state_->disposed.exchange(true)) return;
    if (auto host = state_->host.lock()) {
        host->remove_listener(state_->token);
    }
}

bool Subscription::disposed() const {
    return !state_ || state_->disposed.load();
}

void Subscription::disposed_by(DisposeBag& bag) const {
    bag.add(*this);
}

} // namespace fanout
