#pragma once
#include "channel.hpp"
#include <optional>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace fanout {

// Derived channels.
//
// Each operator creates a new pair and subscribes once to `source`. The
// upstream handler owns the new Emitter, so the derived channel stays alive
// for as long as the source does. Unless noted, the derived channel uses the
// source's strategy; values the source replays go through the operator like
// live ones, so the derived history matches applying the operator from the
// first value on.
//
// Operator state is only touched from deliveries of the source channel,
// which that channel serializes.

// Forward f(value) for every value.
template<typename V, typename F>
auto map(const Channel<V>& source, F f)
    -> Channel<std::decay_t<std::invoke_result_t<F&, const V&>>> {
    using U = std::decay_t<std::invoke_result_t<F&, const V&>>;
    auto made = make_channel<U>(source.strategy());
    source.listen([emitter = made.first, f = std::move(f)](const V& value) mutable {
        emitter.broadcast(f(value));
    });
    return made.second;
}

// Forward values for which pred holds.
template<typename V, typename Pred>
Channel<V> filter(const Channel<V>& source, Pred pred) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first, pred = std::move(pred)](const V& value) mutable {
        if (pred(value)) emitter.broadcast(value);
    });
    return made.second;
}

// Drop a value equal to the one forwarded just before it.
template<typename V>
Channel<V> skip_repeats(const Channel<V>& source) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first, last = std::optional<V>()](const V& value) mutable {
        if (last && *last == value) return;
        last = value;
        emitter.broadcast(value);
    });
    return made.second;
}

// Forward each distinct value the first time it is seen. V must be hashable.
template<typename V>
Channel<V> unique_values(const Channel<V>& source) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first, seen = std::unordered_set<V>()](const V& value) mutable {
        if (!seen.insert(value).second) return;
        emitter.broadcast(value);
    });
    return made.second;
}

// Pair every value with the one before it; first is empty for the first value.
template<typename V>
Channel<std::pair<std::optional<V>, V>> with_previous(const Channel<V>& source) {
    using Pair = std::pair<std::optional<V>, V>;
    auto made = make_channel<Pair>(source.strategy());
    source.listen([emitter = made.first, previous = std::optional<V>()](const V& value) mutable {
        emitter.broadcast(Pair(previous, value));
        previous = value;
    });
    return made.second;
}

// Drop the first `count` values. count <= 0 forwards everything.
template<typename V>
Channel<V> skip(const Channel<V>& source, int count) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first, remaining = count](const V& value) mutable {
        if (remaining > 0) {
            --remaining;
            return;
        }
        emitter.broadcast(value);
    });
    return made.second;
}

// Forward only the first `count` values. count <= 0 forwards nothing.
// The upstream subscription stays registered but inert afterwards.
template<typename V>
Channel<V> take(const Channel<V>& source, int count) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first, remaining = count](const V& value) mutable {
        if (remaining <= 0) return;
        --remaining;
        emitter.broadcast(value);
    });
    return made.second;
}

// Drop empty optionals and forward the contained value otherwise.
template<typename V>
Channel<V> skip_nil(const Channel<std::optional<V>>& source) {
    auto made = make_channel<V>(source.strategy());
    source.listen([emitter = made.first](const std::optional<V>& value) {
        if (value) emitter.broadcast(*value);
    });
    return made.second;
}

// Forward every value, but never replay: the derived channel is always
// NoBuffering, whatever the source retains.
template<typename V>
Channel<V> hot_only(const Channel<V>& source) {
    auto made = make_channel<V>(Strategy::none());
    source.listen([emitter = made.first](const V& value) {
        emitter.broadcast(value);
    });
    return made.second;
}

} // namespace fanout
