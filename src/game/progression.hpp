// SPDX-License-Identifier: Apache-2.0
// progression.hpp - Score/combo/experience, level-ups and the spawn director
#pragma once
#include "game/entities.hpp"
#include "game/match.hpp"

#include <cstdint>

namespace serpent::game {

// Experience needed to leave the given level.
float xp_required(uint32_t level, const Tuning &t);

// Rewarded event: score += round(points * combo), xp += points, combo nudged up and its hold timer refreshed.
// Triggers a level-up when the threshold is crossed.
void gain_score(MatchState &m, float points);
// Carry over xp, advance the level, pay mission rewards, draw new missions, buff the player.
void level_up(MatchState &m);
// Count down the combo hold timer; once it runs out relax the multiplier toward 1.
void relax_combo(MatchState &m, float dt);
// Landed damage: combo back to 1, damage flag set, camera shake.
void register_player_hit(MatchState &m, float dealt, float shake);

// Base enemy spawn period for a level (before jitter).
float spawn_interval(uint32_t level, const Tuning &t);
// Weighted kind for a uniform roll in [0, 1).
EnemyKind roll_enemy_kind(float roll);
bool boss_alive(const MatchState &m);
// Rolled kind, overridden to boss on boss levels while no boss is alive.
EnemyKind choose_enemy_kind(const MatchState &m, float roll);

// Place a new enemy just outside a random edge.
Enemy &spawn_enemy(MatchState &m);
Enemy &spawn_enemy_at(MatchState &m, EnemyKind kind, b2Vec2 pos);
Pickup &spawn_pickup(MatchState &m);
// Fire the enemy and pickup spawn timers (already advanced by the dilated delta).
void run_spawners(MatchState &m);

} // namespace serpent::game
