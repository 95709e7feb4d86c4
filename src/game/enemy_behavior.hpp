// SPDX-License-Identifier: Apache-2.0
// enemy_behavior.hpp - Per-archetype movement and attack, dispatched from the enemy kind
#pragma once
#include "game/effects.hpp"
#include "game/entities.hpp"
#include "game/physics.hpp"
#include "game/random.hpp"

#include <vector>

namespace serpent::game {

struct EnemyStepContext
{
    b2Vec2 target; // player head
    const phys::Bounds &bounds;
    Rng &rng;
    std::vector<Projectile> &enemy_projectiles;
    FrameEffects &effects;
};

// Advance one enemy by dt (already dilated by the caller when a temporal burst is active).
// Returns the number of projectiles fired this step.
uint32_t step_enemy(Enemy &e, float dt, EnemyStepContext &ctx);

} // namespace serpent::game
