#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace fanout {

// Buffering policy of a channel. Fixed when the channel is created.
//
//   NoBuffering     values broadcast before a listener attaches are lost
//   BoundedReplay   the last `capacity` values are replayed on attach
//   UnboundedReplay every value ever broadcast is replayed on attach
//
// Expecting replay from a NoBuffering channel is a usage error, not a
// runtime one: listen() simply replays nothing.
struct Strategy {
    enum class Kind { NoBuffering, BoundedReplay, UnboundedReplay };

    Kind kind = Kind::NoBuffering;
    size_t capacity = 0; // only meaningful for BoundedReplay

    static Strategy none() { return Strategy{}; }
    static Strategy bounded(size_t capacity) {
        return Strategy{Kind::BoundedReplay, capacity};
    }
    static Strategy unbounded() { return Strategy{Kind::UnboundedReplay, 0}; }

    // True if anything can ever be replayed to a late listener.
    bool retains() const;

    // Upper bound on the number of values replayed on attach.
    // SIZE_MAX for UnboundedReplay (and BoundedReplay(SIZE_MAX)).
    size_t replay_limit() const;

    bool operator==(const Strategy& other) const;
    bool operator!=(const Strategy& other) const { return !(*this == other); }
};

// "none", "bounded(N)" or "unbounded"
std::string to_string(const Strategy& strategy);

// Parse a strategy name. Accepts none/hot, bounded/warm, unbounded/cold
// (case-insensitive). `capacity` is used for bounded/warm only.
// Throws std::invalid_argument on an unknown name.
Strategy parse_strategy(const std::string& name, size_t capacity = 0);

} // namespace fanout
