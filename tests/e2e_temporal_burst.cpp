// SPDX-License-Identifier: Apache-2.0
// e2e_temporal_burst.cpp
// Time dilation: hostile clocks run at half rate while the player, its shots and the match clock do not.
#include "game/progression.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace serpent;
namespace key = serpent::input::key;

int main()
{
    auto m = test::make_quiet_match();
    game::spawn_enemy_at(m, game::EnemyKind::sniper, {100.f, 600.f});
    m.enemies[0].fire_cooldown = 1.f;

    test::ScriptedInput in;
    in.tap(key::burst);
    assert(game::world_time_scale(m) == 1.f);
    game::tick(m, in, test::k_dt);
    assert(m.player.burst_active());
    assert(game::world_time_scale(m) == m.tuning.burst_time_scale);
    // The trigger frame itself still ran at full rate.
    float c1 = m.enemies[0].fire_cooldown;
    assert(test::near(c1, 1.f - test::k_dt));
    assert(test::near(m.wave_time, test::k_dt));

    // Enemy shots crawl.
    game::Projectile slow{};
    slow.pos = {100.f, 50.f};
    slow.vel = {100.f, 0.f};
    slow.ttl = 10.f;
    m.enemy_projectiles.push_back(slow);
    game::tick(m, in, test::k_dt);
    assert(m.enemy_projectiles.size() == 1);
    assert(test::near(m.enemy_projectiles[0].pos.x, 100.f + 100.f * test::k_dt * 0.5f));
    assert(test::near(m.player.speed, 170.f * 1.3f));

    // Player shots do not.
    b2Vec2 head = m.player.head;
    in.tap(key::fire);
    game::tick(m, in, test::k_dt);
    assert(m.projectiles.size() == 3);
    assert(test::near(m.projectiles[1].pos.x - head.x, 360.f * test::k_dt));

    for (int i = 0; i < 28; ++i)
        game::tick(m, in, test::k_dt);
    // 31 frames: 1 undilated + 30 dilated
    float c2 = m.enemies[0].fire_cooldown;
    assert(test::near(c1 - c2, 30.f * test::k_dt * 0.5f));
    assert(test::near(m.elapsed, 31.f * test::k_dt));
    assert(test::near(m.wave_time, test::k_dt + 30.f * test::k_dt * 0.5f));

    // Burst runs out after 2.2s of player time.
    for (int i = 0; i < 110; ++i)
        game::tick(m, in, test::k_dt);
    assert(!m.player.burst_active());
    assert(game::world_time_scale(m) == 1.f);
    float wave = m.wave_time;
    game::tick(m, in, test::k_dt);
    assert(test::near(m.wave_time - wave, test::k_dt));

    std::cout << "e2e_temporal_burst OK" << std::endl;
    return 0;
}
