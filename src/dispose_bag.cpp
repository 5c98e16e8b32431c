#include "dispose_bag.hpp"

namespace fanout {

DisposeBag::~DisposeBag() {
    dispose_all();
}

void DisposeBag::add(Subscription subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.push_back(std::move(subscription));
}

void DisposeBag::dispose_all() {
    // Copy out under lock, dispose without it held
    std::vector<Subscription> to_dispose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_dispose.swap(subscriptions_);
    }
    for (auto& sub : to_dispose) {
        sub.dispose();
    }
}

size_t DisposeBag::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace fanout
