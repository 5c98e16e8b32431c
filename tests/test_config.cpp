#include <catch2/catch.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace fanout;

// ── Defaults ────────────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.default_strategy == Strategy::none());
    REQUIRE(cfg.channels.empty());
    REQUIRE(cfg.strategy_for("anything") == Strategy::none());
}

TEST_CASE("Config::defaults_json parses to defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.default_strategy == Strategy::none());
    REQUIRE(cfg.channels.empty());
}

// ── strategy_from_json ──────────────────────────────────────────

TEST_CASE("strategy_from_json: object form", "[config]") {
    REQUIRE(strategy_from_json({{"kind", "none"}}) == Strategy::none());
    REQUIRE(strategy_from_json({{"kind", "bounded"}, {"capacity", 4}}) == Strategy::bounded(4));
    REQUIRE(strategy_from_json({{"kind", "unbounded"}}) == Strategy::unbounded());
}

TEST_CASE("strategy_from_json: string form with aliases", "[config]") {
    REQUIRE(strategy_from_json("hot") == Strategy::none());
    REQUIRE(strategy_from_json("cold") == Strategy::unbounded());
    REQUIRE(strategy_from_json("warm:3") == Strategy::bounded(3));
    REQUIRE(strategy_from_json("bounded:0") == Strategy::bounded(0));
}

TEST_CASE("strategy_from_json: rejects bad input", "[config]") {
    REQUIRE_THROWS_AS(strategy_from_json("tepid"), std::invalid_argument);
    REQUIRE_THROWS_AS(strategy_from_json("warm:x"), std::invalid_argument);
    REQUIRE_THROWS_AS(strategy_from_json(42), std::invalid_argument);
    REQUIRE_THROWS_AS(strategy_from_json({{"capacity", 2}}), std::invalid_argument);
    REQUIRE_THROWS_AS(strategy_from_json({{"kind", "bounded"}, {"capacity", -1}}),
                      std::invalid_argument);
}

TEST_CASE("strategy_to_json: round-trips through strategy_from_json", "[config]") {
    for (const auto& s : {Strategy::none(), Strategy::bounded(9), Strategy::unbounded()}) {
        REQUIRE(strategy_from_json(strategy_to_json(s)) == s);
    }
}

// ── from_json ───────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads default and per-channel strategies", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "default_strategy": "cold",
        "channels": {
            "telemetry": {"kind": "bounded", "capacity": 16},
            "ui": "hot"
        }
    })");
    Config cfg = Config::from_json(j);

    REQUIRE(cfg.default_strategy == Strategy::unbounded());
    REQUIRE(cfg.strategy_for("telemetry") == Strategy::bounded(16));
    REQUIRE(cfg.strategy_for("ui") == Strategy::none());
    REQUIRE(cfg.strategy_for("other") == Strategy::unbounded());
}

TEST_CASE("Config::from_json: missing keys take defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::object());
    REQUIRE(cfg.default_strategy == Strategy::none());
    REQUIRE(cfg.channels.empty());
}

TEST_CASE("Config::from_json: bad entry throws", "[config]") {
    auto j = nlohmann::json::parse(R"({"channels": {"x": "sometimes"}})");
    REQUIRE_THROWS_AS(Config::from_json(j), std::invalid_argument);
    REQUIRE_THROWS_AS(Config::from_json(nlohmann::json::array()), std::invalid_argument);
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "fanout_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: temp dir for config files, removed on destruction
struct ConfigTestGuard {
    std::string dir;

    ConfigTestGuard() {
        dir = make_temp_dir();
        unsetenv("FANOUT_DEFAULT_STRATEGY");
    }

    ~ConfigTestGuard() {
        unsetenv("FANOUT_DEFAULT_STRATEGY");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/fanout.json"; }

    void write_config(const std::string& content) {
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "default_strategy": {"kind": "bounded", "capacity": 2},
        "channels": {"log": "unbounded"}
    })");

    Config cfg = Config::load(g.config_path());
    REQUIRE(cfg.default_strategy == Strategy::bounded(2));
    REQUIRE(cfg.strategy_for("log") == Strategy::unbounded());
}

TEST_CASE("Config::load: missing file uses defaults", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load(g.dir + "/does-not-exist.json");
    REQUIRE(cfg.default_strategy == Strategy::none());
    REQUIRE(cfg.channels.empty());
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("not valid json {{{");
    Config cfg = Config::load(g.config_path());
    REQUIRE(cfg.default_strategy == Strategy::none());
}

TEST_CASE("Config::load: invalid strategy falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"default_strategy": "sometimes"})");
    Config cfg = Config::load(g.config_path());
    REQUIRE(cfg.default_strategy == Strategy::none());
}

TEST_CASE("Config::load: environment does not override the file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"default_strategy": "cold"})");
    setenv("FANOUT_DEFAULT_STRATEGY", "warm:5", 1);

    Config cfg = Config::load(g.config_path());
    REQUIRE(cfg.default_strategy == Strategy::unbounded());
}

// ── make_channel from config ────────────────────────────────────

TEST_CASE("make_channel: strategy from named config entry", "[config]") {
    Config cfg;
    cfg.channels["events"] = Strategy::bounded(1);

    auto [emitter, channel] = make_channel<int>(cfg, "events");
    REQUIRE(channel.strategy() == Strategy::bounded(1));

    emitter.broadcast(1);
    emitter.broadcast(2);
    std::vector<int> got;
    channel.listen([&](const int& v) { got.push_back(v); });
    REQUIRE(got == std::vector<int>{2});

    auto [other_emitter, other_channel] = make_channel<int>(cfg, "unlisted");
    (void)other_emitter;
    REQUIRE(other_channel.strategy() == Strategy::none());
}
