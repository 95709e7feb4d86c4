// SPDX-License-Identifier: Apache-2.0
// e2e_match_invariants.cpp
// Long autopilot and idle runs: resource bounds, combo range, unit facing, compaction, single boss,
// mission flags; plus game over, frame clamping, pause and restart.
#include "game/progression.hpp"
#include "headless/autopilot.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace serpent;
namespace key = serpent::input::key;

static void check(const game::MatchState &m)
{
    const game::Player &p = m.player;
    assert(p.health >= 0.f && p.health <= p.max_health);
    assert(p.shield >= 0.f && p.shield <= m.tuning.player_max_shield);
    assert(m.combo >= 1.f && m.combo <= m.tuning.combo_max);
    assert(test::near(b2Length(p.dir), 1.f));
    assert(p.primary_cooldown >= 0.f && p.dash_cooldown >= 0.f);
    assert(p.burst_cooldown >= 0.f && p.mine_cooldown >= 0.f);
    assert(p.segments.size() == p.length);
    size_t bosses = 0;
    for (auto &e : m.enemies) {
        assert(e.alive);
        assert(e.health <= e.max_health);
        if (e.kind == game::EnemyKind::boss)
            ++bosses;
    }
    assert(bosses <= 1);
    for (auto &pr : m.projectiles)
        assert(pr.alive);
    for (auto &pr : m.enemy_projectiles)
        assert(pr.alive);
    for (auto &mine : m.mines)
        assert(mine.alive);
    for (auto &c : m.pickups)
        assert(!c.collected);
    assert(m.pickups.size() <= m.tuning.max_pickups);
    for (auto &mission : m.missions.missions()) {
        assert(!(mission.done && mission.failed));
        assert(mission.progress <= mission.target);
    }
}

static void autopilot_run(uint32_t seed)
{
    test::quiet_logs();
    game::MatchState m;
    m.rng.seed(seed);
    headless::Autopilot pilot(m);
    game::start_match(m);
    uint32_t games = 1;
    uint32_t best_level = 1;
    for (int i = 0; i < 20000; ++i) {
        pilot.plan();
        game::tick(m, pilot, test::k_dt);
        check(m);
        if (m.level > best_level)
            best_level = m.level;
        if (m.phase == game::Phase::game_over) {
            assert(m.effects.has_cue(game::AudioCue::death));
            assert(m.player.health <= 0.f);
            game::start_match(m);
            ++games;
        }
    }
    assert(games >= 1);
    assert(best_level >= 1);
}

static void idle_run()
{
    auto m = test::make_quiet_match(11);
    m.spawn_timer = 0.f;
    m.pickup_spawn_timer = 0.f;
    test::ScriptedInput idle;
    for (int i = 0; i < 6000 && m.phase == game::Phase::running; ++i) {
        game::tick(m, idle, test::k_dt);
        check(m);
    }
}

static void game_over_and_restart()
{
    auto m = test::make_quiet_match();
    m.player.health = 1.f;
    game::spawn_enemy_at(m, game::EnemyKind::tank, m.player.head);
    test::ScriptedInput idle;
    game::tick(m, idle, test::k_dt);
    assert(m.phase == game::Phase::game_over);
    assert(m.player.health == 0.f);
    assert(m.effects.has_cue(game::AudioCue::death));
    assert(m.took_damage_this_level);

    // Nothing advances after game over.
    uint64_t ticks = m.tick;
    float elapsed = m.elapsed;
    game::tick(m, idle, test::k_dt);
    assert(m.tick == ticks && m.elapsed == elapsed);
    assert(m.effects.cues.empty());

    game::start_match(m);
    assert(m.phase == game::Phase::running);
    assert(m.score == 0 && m.level == 1 && m.player.health == 100.f);
    assert(m.enemies.empty() && m.pickups.empty());
    assert(!m.took_damage_this_level);
}

static void clamp_and_pause()
{
    auto m = test::make_quiet_match();
    test::ScriptedInput in;
    game::tick(m, in, 0.2f);
    assert(test::near(m.elapsed, m.tuning.max_frame_dt));
    game::tick(m, in, -1.f);
    assert(test::near(m.elapsed, m.tuning.max_frame_dt));

    in.tap(key::pause);
    game::tick(m, in, test::k_dt);
    assert(m.phase == game::Phase::paused);
    b2Vec2 head = m.player.head;
    float elapsed = m.elapsed;
    in.tap(key::fire); // pressed while paused: forgotten at end of frame
    test::run_ticks(m, in, 10);
    assert(m.elapsed == elapsed);
    assert(m.player.head.x == head.x && m.player.head.y == head.y);
    in.tap(key::pause);
    game::tick(m, in, test::k_dt);
    assert(m.phase == game::Phase::running);
    assert(m.elapsed > elapsed); // the resume frame already advances
    assert(m.projectiles.empty());

    game::MatchState menu;
    test::run_ticks(menu, in, 5);
    assert(menu.phase == game::Phase::menu && menu.tick == 0);
}

int main()
{
    autopilot_run(1);
    autopilot_run(2024);
    idle_run();
    game_over_and_restart();
    clamp_and_pause();
    std::cout << "e2e_match_invariants OK" << std::endl;
    return 0;
}
