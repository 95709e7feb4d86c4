// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "game/effects.hpp"
#include "game/entities.hpp"
#include "game/input.hpp"
#include "game/missions.hpp"
#include "game/physics.hpp"
#include "game/player.hpp"
#include "game/random.hpp"
#include "game/tuning.hpp"

#include <cstdint>
#include <vector>

namespace serpent::game {

enum class Phase : uint8_t
{
    menu,
    running,
    paused,
    game_over
};

const char *phase_name(Phase phase);

// Running totals for the current match (logging / driver metrics only).
struct MatchStats
{
    uint32_t kills{0};
    uint32_t mine_kills{0};
    uint32_t bosses_killed{0};
    uint32_t pickups_collected{0};
    uint32_t volleys_fired{0};
    uint32_t mines_dropped{0};
    float damage_taken{0.f};
};

// The whole mutable world. Owned by the caller of tick(); resolvers receive it by reference for the
// duration of one call and never keep pointers into its collections.
struct MatchState
{
    Tuning tuning;
    phys::Bounds bounds;
    Rng rng{1u};

    Phase phase{Phase::menu};
    uint64_t tick{0};
    // Undilated seconds since the match started and the dilated wave clock.
    float elapsed{0.f};
    float wave_time{0.f};

    Player player;
    std::vector<Enemy> enemies;
    std::vector<Projectile> projectiles; // player-fired
    std::vector<Projectile> enemy_projectiles;
    std::vector<Mine> mines;
    std::vector<Pickup> pickups;
    uint32_t next_enemy_id{1};

    // Score, experience and combo
    int64_t score{0};
    uint32_t level{1};
    float xp{0.f};
    float combo{1.f};
    float combo_timer{0.f};
    uint32_t combo_tier{1};
    bool took_damage_this_level{false};

    MissionTracker missions;

    float spawn_timer{0.f};
    float pickup_spawn_timer{0.f};
    float camera_shake{0.f};

    // Side effects requested during the last tick; cleared at the start of the next one.
    FrameEffects effects;
    MatchStats stats;
};

// Reinitialize everything except tuning and the random engine. Leaves the phase at menu.
void reset_match(MatchState &m);
// reset_match + running.
void start_match(MatchState &m);
// Running <-> paused. No effect in other phases.
void toggle_pause(MatchState &m);

// Rate for hostile entities and the wave/spawn clocks: burst_time_scale while a temporal burst is active.
float world_time_scale(const MatchState &m);

// Advance the world by one frame. frame_dt is clamped to [0, tuning.max_frame_dt]. Outside the running
// phase nothing advances; the input edge state is still reset.
void tick(MatchState &m, input::InputSource &in, float frame_dt);

} // namespace serpent::game
