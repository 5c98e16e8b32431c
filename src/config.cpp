#include "config.hpp"
#include "util.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fanout {

nlohmann::json Config::defaults_json() {
    return {
        {"default_strategy", {{"kind", "none"}}},
        {"channels", nlohmann::json::object()}
    };
}

Strategy strategy_from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        // "bounded:8" / "warm:8" shorthand
        auto parts = split(j.get<std::string>(), ':');
        if (parts.size() == 2) {
            auto capacity = parse_size(parts[1]);
            if (!capacity) {
                throw std::invalid_argument("Invalid strategy capacity: " + parts[1]);
            }
            return parse_strategy(parts[0], *capacity);
        }
        return parse_strategy(j.get<std::string>());
    }
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        throw std::invalid_argument("Strategy must be a name or an object with \"kind\"");
    }
    size_t capacity = 0;
    if (j.contains("capacity")) {
        if (!j["capacity"].is_number_unsigned()) {
            throw std::invalid_argument("Strategy capacity must be a non-negative integer");
        }
        capacity = j["capacity"].get<size_t>();
    }
    return parse_strategy(j["kind"].get<std::string>(), capacity);
}

nlohmann::json strategy_to_json(const Strategy& strategy) {
    switch (strategy.kind) {
        case Strategy::Kind::NoBuffering:
            return {{"kind", "none"}};
        case Strategy::Kind::BoundedReplay:
            return {{"kind", "bounded"}, {"capacity", strategy.capacity}};
        case Strategy::Kind::UnboundedReplay:
            return {{"kind", "unbounded"}};
    }
    return {{"kind", "none"}};
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& input) {
    Config cfg;
    if (!input.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }
    nlohmann::json j = merge_defaults(input, defaults_json());

    cfg.default_strategy = strategy_from_json(j["default_strategy"]);

    if (j["channels"].is_object()) {
        for (auto& [name, entry] : j["channels"].items()) {
            cfg.channels[name] = strategy_from_json(entry);
        }
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    Config cfg = from_json(defaults_json());

    std::string config_path = expand_home(path);
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << ", using defaults: " << e.what() << "\n";
        } catch (const std::invalid_argument& e) {
            std::cerr << "[config] Invalid config " << config_path
                      << ", using defaults: " << e.what() << "\n";
        }
    }

    return cfg;
}

Strategy Config::strategy_for(const std::string& name) const {
    auto it = channels.find(name);
    if (it != channels.end()) return it->second;
    return default_strategy;
}

} // namespace fanout
