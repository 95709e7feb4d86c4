// SPDX-License-Identifier: Apache-2.0
// unit_mine_blast.cpp
// Mine arming, trigger radius, blast falloff and mine-kill attribution.
#include "game/collision.hpp"
#include "game/progression.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace serpent;

static game::Mine armed_mine(b2Vec2 pos)
{
    game::Mine mine{};
    mine.pos = pos;
    mine.arm_timer = 0.f;
    return mine;
}

int main()
{
    game::Tuning t;
    assert(test::near(game::mine_blast_damage(0.f, t), 65.f));
    assert(test::near(game::mine_blast_damage(90.f, t), 33.5f));
    assert(test::near(game::mine_blast_damage(260.f, t), -26.f)); // not clamped

    auto m = test::make_quiet_match();
    m.missions.missions() = {game::MissionTracker::templates()[3]};
    assert(m.missions.missions()[0].kind == game::MissionKind::mine_kills);

    // Unarmed mines never trigger.
    game::Mine fresh{};
    fresh.pos = {100.f, 100.f};
    m.mines.push_back(fresh);
    game::spawn_enemy_at(m, game::EnemyKind::tank, {110.f, 100.f});
    game::resolve_mines(m);
    assert(m.mines[0].alive);
    assert(m.enemies[0].health == m.enemies[0].max_health);
    m.mines.clear();
    m.enemies.clear();

    m.mines.push_back(armed_mine({100.f, 100.f}));
    game::spawn_enemy_at(m, game::EnemyKind::tank, {120.f, 100.f}); // trigger: 20 < 10 + 18 + 3
    game::spawn_enemy_at(m, game::EnemyKind::drone, {100.f, 180.f}); // blast: 80 < 90 + 14
    game::spawn_enemy_at(m, game::EnemyKind::runner, {100.f, 300.f}); // out of reach
    game::resolve_mines(m);

    assert(!m.mines[0].alive);
    assert(!m.enemies[0].alive);
    assert(!m.enemies[1].alive);
    assert(m.enemies[2].alive && m.enemies[2].health == m.enemies[2].max_health);
    assert(m.stats.mine_kills == 2);
    assert(m.missions.missions()[0].progress == 2.f);
    assert(m.score == 85 + 42); // second kill scored at combo 1.05
    assert(m.player.length == 20);
    assert(m.effects.has_cue(game::AudioCue::hit));

    game::compact_collections(m);
    assert(m.mines.empty());
    assert(m.enemies.size() == 1 && m.enemies[0].kind == game::EnemyKind::runner);

    // A trigger just outside the slack leaves the mine armed.
    m.mines.push_back(armed_mine({500.f, 100.f}));
    game::spawn_enemy_at(m, game::EnemyKind::runner, {524.f, 100.f}); // 24 >= 10 + 10 + 3
    game::resolve_mines(m);
    assert(m.mines[0].alive);

    std::cout << "unit_mine_blast OK" << std::endl;
    return 0;
}
