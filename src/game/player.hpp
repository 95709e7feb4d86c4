// SPDX-License-Identifier: Apache-2.0
// player.hpp - Serpent head/body, resource model (health, shield, invulnerability) and ability state machine
#pragma once
#include "game/effects.hpp"
#include "game/entities.hpp"
#include "game/input.hpp"
#include "game/physics.hpp"
#include "game/tuning.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <deque>
#include <vector>

namespace serpent::game {

struct Player
{
    b2Vec2 head{0.f, 0.f};
    b2Vec2 dir{1.f, 0.f}; // smoothed facing, unit length
    b2Vec2 target_dir{1.f, 0.f}; // last non-zero input direction
    float speed{0.f};

    float max_health{100.f};
    float health{100.f};
    float shield{0.f};
    float invuln_timer{0.f};

    // Cooldowns count down every tick; an ability may trigger only at <= 0.
    float primary_cooldown{0.f};
    float dash_cooldown{0.f};
    float burst_cooldown{0.f};
    float mine_cooldown{0.f};
    // Active-duration timers
    float dash_time{0.f};
    float burst_time{0.f};

    uint32_t length{0};
    std::vector<b2Vec2> segments;
    std::deque<b2Vec2> trail; // most recent head position first

    bool dash_active() const { return dash_time > 0.f; }

    bool burst_active() const { return burst_time > 0.f; }
};

// Abilities triggered during one update (for stats/logging by the caller).
struct PlayerActions
{
    bool fired{false};
    bool dashed{false};
    bool burst{false};
    bool mine{false};
};

// Where player-spawned ordnance and presentation requests go.
struct PlayerOutputs
{
    std::vector<Projectile> &projectiles;
    std::vector<Mine> &mines;
    FrameEffects &effects;
};

Player make_player(b2Vec2 pos, const Tuning &t);

// Combined movement multiplier of the active abilities (dash and burst stack).
float speed_multiplier(const Player &p, const Tuning &t);
float movement_speed(const Player &p, const Tuning &t);

// Shield absorbs first, the remainder reduces health. Returns the amount that landed: 0 while the
// invulnerability window is open (no state changes at all), otherwise the requested amount.
float apply_damage(Player &p, float amount, const Tuning &t);
void heal(Player &p, float amount);
void add_shield(Player &p, float amount, const Tuning &t);
void grow(Player &p, uint32_t amount);

// Reads held directions into target_dir; keeps the previous target when nothing is held.
void aim_from_input(Player &p, const input::InputSource &in);

PlayerActions update_player(
    Player &p, input::InputSource &in, float dt, const Tuning &t, const phys::Bounds &bounds, PlayerOutputs out);

} // namespace serpent::game
