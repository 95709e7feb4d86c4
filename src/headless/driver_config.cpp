// SPDX-License-Identifier: Apache-2.0
#include "headless/driver_config.hpp"

#include "game/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace serpent::headless {

namespace {

// Signed parse so that "-5" is rejected instead of wrapping around.
uint32_t parse_flag_value(const std::string &flag, const std::string &text)
{
    long long v = std::stoll(text);
    if (v < 0 || v > static_cast<long long>(std::numeric_limits<uint32_t>::max()))
        throw std::invalid_argument(flag + " out of range: " + text);
    return static_cast<uint32_t>(v);
}

} // namespace

DriverConfig load_driver_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    DriverConfig cfg;
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["duration_seconds"])
        cfg.duration_seconds = root["duration_seconds"].as<uint32_t>();
    if (root["seed"])
        cfg.seed = root["seed"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["autopilot"])
        cfg.autopilot = root["autopilot"].as<bool>();
    if (root["snapshot_interval_ticks"])
        cfg.snapshot_interval_ticks = root["snapshot_interval_ticks"].as<uint32_t>();
    if (root["metrics_interval_seconds"])
        cfg.metrics_interval_seconds = root["metrics_interval_seconds"].as<uint32_t>();
    if (root["restart_on_game_over"])
        cfg.restart_on_game_over = root["restart_on_game_over"].as<bool>();
    game::apply_tuning_overrides(cfg.tuning, root["tuning"]);
    if (cfg.tick_rate == 0)
        throw std::invalid_argument("tick_rate must be positive");
    return cfg;
}

std::string config_path_from_args(int argc, char **argv, const std::string &fallback)
{
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--duration" || a == "--seed" || a == "--tick-rate") {
            ++i; // skip the value
        } else if (!a.empty() && a[0] != '-') {
            return a;
        }
    }
    return fallback;
}

void apply_cli_overrides(DriverConfig &cfg, int argc, char **argv)
{
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--no-autopilot") {
            cfg.autopilot = false;
        } else if (a == "--duration" && i + 1 < argc) {
            cfg.duration_seconds = parse_flag_value(a, argv[++i]);
        } else if (a == "--seed" && i + 1 < argc) {
            cfg.seed = parse_flag_value(a, argv[++i]);
        } else if (a == "--tick-rate" && i + 1 < argc) {
            cfg.tick_rate = parse_flag_value(a, argv[++i]);
            if (cfg.tick_rate == 0)
                throw std::invalid_argument("--tick-rate must be positive");
        }
    }
}

} // namespace serpent::headless
