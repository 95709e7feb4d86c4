// SPDX-License-Identifier: Apache-2.0
#include "game/config_loader.hpp"

#include <stdexcept>

namespace serpent::game {

namespace {

template <typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key])
        out = node[key].as<T>();
}

} // namespace

void apply_tuning_overrides(Tuning &t, const YAML::Node &node)
{
    if (!node || node.IsNull())
        return;
    if (!node.IsMap())
        throw std::invalid_argument("tuning: expected a map");
    read(node, "world_width", t.world_width);
    read(node, "world_height", t.world_height);
    read(node, "max_frame_dt", t.max_frame_dt);
    read(node, "player_base_speed", t.player_base_speed);
    read(node, "player_turn_rate", t.player_turn_rate);
    read(node, "player_max_health", t.player_max_health);
    read(node, "player_max_shield", t.player_max_shield);
    read(node, "invulnerability_window_sec", t.invulnerability_window_sec);
    read(node, "primary_cooldown_sec", t.primary_cooldown_sec);
    read(node, "dash_cooldown_sec", t.dash_cooldown_sec);
    read(node, "burst_cooldown_sec", t.burst_cooldown_sec);
    read(node, "mine_cooldown_sec", t.mine_cooldown_sec);
    read(node, "dash_duration_sec", t.dash_duration_sec);
    read(node, "burst_duration_sec", t.burst_duration_sec);
    read(node, "dash_speed_mult", t.dash_speed_mult);
    read(node, "burst_speed_mult", t.burst_speed_mult);
    read(node, "burst_time_scale", t.burst_time_scale);
    read(node, "combo_step", t.combo_step);
    read(node, "combo_max", t.combo_max);
    read(node, "combo_hold_sec", t.combo_hold_sec);
    read(node, "combo_decay_rate", t.combo_decay_rate);
    read(node, "max_pickups", t.max_pickups);
    read(node, "boss_level_interval", t.boss_level_interval);
    read(node, "double_spawn_level", t.double_spawn_level);
    validate_tuning(t);
}

void validate_tuning(const Tuning &t)
{
    if (t.world_width <= 2.f * t.pickup_spawn_margin || t.world_height <= 2.f * t.pickup_spawn_margin)
        throw std::invalid_argument("tuning: world too small for the pickup spawn margin");
    if (t.max_frame_dt <= 0.f)
        throw std::invalid_argument("tuning: max_frame_dt must be positive");
    if (t.burst_time_scale <= 0.f || t.burst_time_scale > 1.f)
        throw std::invalid_argument("tuning: burst_time_scale must be in (0, 1]");
    if (t.combo_max < 1.f || t.combo_max > 6.f)
        throw std::invalid_argument("tuning: combo_max must be in [1, 6]");
    if (t.player_max_shield < 0.f || t.player_max_shield > 120.f)
        throw std::invalid_argument("tuning: player_max_shield must be in [0, 120]");
    if (t.player_max_health <= 0.f)
        throw std::invalid_argument("tuning: player_max_health must be positive");
}

Tuning load_tuning_file(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    Tuning t;
    apply_tuning_overrides(t, root["tuning"]);
    return t;
}

} // namespace serpent::game
