// SPDX-License-Identifier: Apache-2.0
// unit_snapshot.cpp
// FrameSnapshot contents: entities, cooldown readiness, HUD block and phase.
#include "game/progression.hpp"
#include "game/snapshot.hpp"
#include "serpent.pb.h"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace serpent;

int main()
{
    assert(game::cooldown_ratio(0.f, 0.18f) == 1.f);
    assert(test::near(game::cooldown_ratio(0.09f, 0.18f), 0.5f));
    assert(game::cooldown_ratio(5.f, 3.5f) == 0.f);
    assert(game::cooldown_ratio(1.f, 0.f) == 1.f);

    auto m = test::make_quiet_match();
    auto &boss = game::spawn_enemy_at(m, game::EnemyKind::boss, {100.f, 100.f});
    boss.health = boss.max_health * 0.5f;
    game::spawn_pickup(m);
    game::Projectile shot{};
    shot.pos = {10.f, 20.f};
    m.enemy_projectiles.push_back(shot);
    m.player.dash_cooldown = m.tuning.dash_cooldown_sec; // just used
    m.camera_shake = 3.f;

    serpent::wire::FrameSnapshot snap;
    game::build_frame_snapshot(m, snap);
    assert(snap.phase() == serpent::wire::PHASE_RUNNING);
    assert(snap.world_width() == 960.f && snap.world_height() == 640.f);
    assert(snap.camera_shake() == 3.f);
    assert(snap.player().segments_size() == 18);
    assert(snap.player().length() == 18);
    assert(snap.player().health() == 100.f);
    assert(snap.player().cooldowns().dash() == 0.f);
    assert(snap.player().cooldowns().primary() == 1.f);
    assert(snap.enemies_size() == 1);
    assert(snap.enemies(0).kind() == serpent::wire::ENEMY_BOSS);
    assert(test::near(snap.enemies(0).health_ratio(), 0.5f));
    assert(snap.enemies(0).color() == 0xff3b73);
    assert(snap.projectiles_size() == 1 && snap.projectiles(0).hostile());
    assert(snap.pickups_size() == 1);
    assert(snap.hud().combo() == "x1.00");
    assert(snap.hud().missions_size() == 2);
    assert(!snap.time_dilated());

    // The message is reused across frames: rebuilding replaces instead of appending.
    m.enemies.clear();
    game::build_frame_snapshot(m, snap);
    assert(snap.enemies_size() == 0);
    assert(snap.player().segments_size() == 18);

    std::string bytes;
    assert(snap.SerializeToString(&bytes));
    serpent::wire::FrameSnapshot parsed;
    assert(parsed.ParseFromString(bytes));
    assert(parsed.hud().missions_size() == 2);

    m.phase = game::Phase::game_over;
    game::build_frame_snapshot(m, snap);
    assert(snap.phase() == serpent::wire::PHASE_GAME_OVER);

    std::cout << "unit_snapshot OK" << std::endl;
    return 0;
}
