#pragma once
#include "channel.hpp"
#include "strategy.hpp"
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace fanout {

// Strategies for named channels, read from JSON:
//
//   {
//     "default_strategy": {"kind": "none"},
//     "channels": {
//       "telemetry": {"kind": "bounded", "capacity": 16},
//       "log": "cold"
//     }
//   }
struct Config {
    Strategy default_strategy;
    std::unordered_map<std::string, Strategy> channels;

    // Load from a JSON file. A missing or malformed file yields the
    // defaults.
    static Config load(const std::string& path);

    // Parse a config object. Throws std::invalid_argument on a bad
    // strategy entry.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Strategy for a channel name (default_strategy if not listed)
    Strategy strategy_for(const std::string& name) const;
};

// Strategy <-> JSON. Accepts {"kind": ..., "capacity": N} or a bare name.
Strategy strategy_from_json(const nlohmann::json& j);
nlohmann::json strategy_to_json(const Strategy& strategy);

// Pair whose strategy comes from the config entry for `name`.
template<typename V>
std::pair<Emitter<V>, Channel<V>> make_channel(const Config& config,
                                               const std::string& name) {
    return make_channel<V>(config.strategy_for(name));
}

} // namespace fanout
