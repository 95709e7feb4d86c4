// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "game/tuning.hpp"

#include <cstdint>
#include <string>

namespace serpent::headless {

struct DriverConfig
{
    uint32_t tick_rate{60};
    // Seconds to run before shutting down; 0 runs until a signal arrives.
    uint32_t duration_seconds{0};
    uint32_t seed{1};
    std::string log_level{"info"};
    bool log_json{false};
    bool autopilot{true};
    // Build a FrameSnapshot every N ticks (0 disables).
    uint32_t snapshot_interval_ticks{30};
    // Seconds between periodic metrics lines.
    uint32_t metrics_interval_seconds{10};
    // Restart automatically after game over.
    bool restart_on_game_over{true};
    game::Tuning tuning;
};

// Load driver settings and the `tuning:` overrides. Missing keys keep their defaults.
// Throws YAML::Exception when the file is missing or malformed.
DriverConfig load_driver_config(const std::string &path);

// First non-flag argument, or `fallback`.
std::string config_path_from_args(int argc, char **argv, const std::string &fallback);
// Apply --duration, --seed, --tick-rate and --no-autopilot on top of the loaded file.
// Throws std::invalid_argument / std::out_of_range on malformed numbers.
void apply_cli_overrides(DriverConfig &cfg, int argc, char **argv);

} // namespace serpent::headless
