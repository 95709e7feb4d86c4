// SPDX-License-Identifier: Apache-2.0
// tuning.hpp - Simulation tunables (defaults are the shipped balance; YAML may override)
#pragma once

#include <cstdint>

namespace serpent::game {

struct Tuning
{
    // World bounds (origin top-left, y grows downwards)
    float world_width{960.f};
    float world_height{640.f};
    // Margin outside the world after which projectiles expire; also the enemy spawn offset.
    float world_margin{20.f};
    // Upper bound applied to the frame delta handed to tick()
    float max_frame_dt{0.05f};

    // Player movement
    float player_base_speed{170.f};
    float player_turn_rate{6.5f};
    float player_speed_per_segment{0.35f};
    uint32_t player_start_length{18};
    float player_segment_spacing{12.f};
    float player_max_health{100.f};
    float player_max_shield{120.f};
    float player_head_radius{11.f};
    float invulnerability_window_sec{0.2f};

    // Abilities: cooldowns
    float primary_cooldown_sec{0.18f};
    float dash_cooldown_sec{3.5f};
    float burst_cooldown_sec{8.f};
    float mine_cooldown_sec{2.2f};
    // Abilities: active durations and speed multipliers
    float dash_duration_sec{0.24f};
    float burst_duration_sec{2.2f};
    float dash_speed_mult{2.6f};
    float burst_speed_mult{1.3f};
    // Rate applied to hostile entities while the temporal burst is active
    float burst_time_scale{0.5f};

    // Primary weapon
    float primary_spread_rad{0.09f};
    float primary_projectile_speed{360.f};
    float primary_projectile_damage{12.f};
    float primary_projectile_radius{4.f};
    float primary_projectile_ttl{1.5f};

    // Mines
    float mine_radius{10.f};
    float mine_arm_sec{0.65f};
    float mine_ttl_sec{6.f};
    float mine_trigger_slack{3.f};
    float mine_blast_radius{90.f};
    float mine_blast_damage{65.f};
    float mine_blast_falloff{0.35f};

    // Combat
    float contact_damage_scale{3.5f};
    float pickup_collect_radius{18.f};

    // Combo / score
    float combo_step{0.05f};
    float combo_max{6.f};
    float combo_hold_sec{4.f};
    // Exponential relax rate toward 1 once the hold timer has run out (per second)
    float combo_decay_rate{5.f};

    // Progression
    float xp_base{450.f};
    float xp_per_level{170.f};
    float level_up_max_health{6.f};
    float level_up_heal{18.f};
    float level_up_shield{18.f};
    float level_banner_sec{0.95f};
    float enemy_scale_per_level{0.16f};

    // Spawning
    float spawn_base_sec{2.2f};
    float spawn_step_per_level{0.08f};
    float spawn_min_sec{0.45f};
    float spawn_jitter{0.25f};
    uint32_t double_spawn_level{6};
    uint32_t boss_level_interval{4};
    float pickup_spawn_min_sec{1.2f};
    float pickup_spawn_max_sec{2.6f};
    float pickup_first_spawn_sec{1.6f};
    float pickup_spawn_margin{30.f};
    uint32_t max_pickups{9};

    // Presentation
    float camera_shake_decay{16.f};
};

} // namespace serpent::game
