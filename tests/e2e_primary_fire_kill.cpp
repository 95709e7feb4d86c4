// SPDX-License-Identifier: Apache-2.0
// e2e_primary_fire_kill.cpp
// Full ticks: a primary volley travels, kills a drone (and later a boss), and the kill reward lands once.
#include "game/progression.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace serpent;
namespace key = serpent::input::key;

static void drone_kill_scores_with_combo()
{
    auto m = test::make_quiet_match();
    assert(m.player.head.x == 480.f && m.player.head.y == 320.f);
    game::spawn_enemy_at(m, game::EnemyKind::drone, {540.f, 320.f});
    m.combo = 2.f;
    m.combo_timer = 4.f;

    test::ScriptedInput in;
    in.tap(key::fire);
    game::tick(m, in, test::k_dt);
    assert(m.projectiles.size() == 3);
    assert(m.effects.has_cue(game::AudioCue::shoot));

    bool killed = false;
    for (int i = 0; i < 60 && !killed; ++i) {
        game::tick(m, in, test::k_dt);
        if (m.enemies.empty()) {
            killed = true;
            assert(m.effects.has_cue(game::AudioCue::hit));
            bool death_burst = false;
            for (auto &b : m.effects.bursts)
                death_burst |= b.count == 22 && b.color == 0xff6f8a;
            assert(death_burst);
        }
    }
    assert(killed);
    assert(m.score == 80); // 40 * combo 2
    assert(test::near(m.combo, 2.05f));
    assert(m.player.length == 19);
    assert(m.player.segments.size() == 19);
    assert(m.stats.kills == 1);
    assert(m.player.health == m.player.max_health);
    // Surplus shots kept flying; the consumed ones were compacted away.
    assert(m.projectiles.size() < 3);
    for (auto &p : m.projectiles)
        assert(p.alive);
}

static void boss_kill_grows_four()
{
    auto m = test::make_quiet_match();
    auto &boss = game::spawn_enemy_at(m, game::EnemyKind::boss, {560.f, 320.f});
    boss.health = 1.f;
    boss.fire_cooldown = 100.f;

    test::ScriptedInput in;
    in.tap(key::fire);
    for (int i = 0; i < 30 && !m.enemies.empty(); ++i)
        game::tick(m, in, test::k_dt);
    assert(m.enemies.empty());
    assert(m.score == 950);
    assert(m.player.length == 22);
    assert(m.stats.bosses_killed == 1);
    assert(!game::boss_alive(m));
}

int main()
{
    drone_kill_scores_with_combo();
    boss_kill_grows_four();
    std::cout << "e2e_primary_fire_kill OK" << std::endl;
    return 0;
}
