#pragma once
#include <mutex>
#include <utility>

namespace fanout {

// Per-channel delivery serialization point.
//
// Work submitted through run() executes while the gate is held, so deliveries
// from different threads are totally ordered. A thread that already holds the
// gate (a handler broadcasting or listening from inside a delivery) runs its
// work inline instead of waiting on itself.
class DeliveryGate {
public:
    DeliveryGate() = default;
    DeliveryGate(const DeliveryGate&) = delete;
    DeliveryGate& operator=(const DeliveryGate&) = delete;

    template<typename Work>
    void run(Work&& work) {
        if (held_by_current_thread()) {
            std::forward<Work>(work)();
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Holder holder(*this);
        std::forward<Work>(work)();
    }

    bool held_by_current_thread() const;

private:
    // Marks the gate as held by this thread for the holder's lifetime.
    class Holder {
    public:
        explicit Holder(const DeliveryGate& gate);
        ~Holder();
        Holder(const Holder&) = delete;
        Holder& operator=(const Holder&) = delete;
    private:
        const DeliveryGate& gate_;
    };

    std::mutex mutex_;
};

} // namespace fanout
