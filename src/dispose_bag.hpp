#pragma once
#include "subscription.hpp"
#include <mutex>
#include <vector>

namespace fanout {

// Collects subscriptions and disposes all of them together, either on
// dispose_all() or when the bag is destroyed. Thread-safe.
class DisposeBag {
public:
    DisposeBag() = default;
    ~DisposeBag();

    DisposeBag(const DisposeBag&) = delete;
    DisposeBag& operator=(const DisposeBag&) = delete;

    void add(Subscription subscription);

    // Dispose every held subscription once, then forget them.
    // The bag can be reused afterwards.
    void dispose_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
};

} // namespace fanout
