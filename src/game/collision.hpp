// SPDX-License-Identifier: Apache-2.0
// collision.hpp - Proximity tests and damage/reward resolution, executed once per tick in a fixed order
#pragma once
#include "game/match.hpp"

namespace serpent::game {

// Falloff damage of a mine blast at the given distance. Not clamped at zero.
float mine_blast_damage(float distance, const Tuning &t);

// Full pass in causal order: pickups, player shots, mines, enemy contact, enemy shots, compaction.
void resolve_collisions(MatchState &m, float dt);

// Individual stages (exposed for focused tests).
void collect_pickups(MatchState &m);
void resolve_player_projectiles(MatchState &m);
void resolve_mines(MatchState &m);
void resolve_enemy_contact(MatchState &m, float dt);
void resolve_enemy_projectiles(MatchState &m);
// Drop dead, expired, consumed and collected entities, keeping survivors in iteration order.
void compact_collections(MatchState &m);

// Kill reward: particles, score, body growth, audio, mission events.
void reward_kill(MatchState &m, const Enemy &e, bool by_mine);

} // namespace serpent::game
