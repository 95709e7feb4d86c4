// SPDX-License-Identifier: Apache-2.0
// unit_collision.cpp
// Pickup effects, first-hit player shots, contact damage, enemy shots and the invulnerability window.
#include "game/collision.hpp"
#include "game/progression.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace serpent;

static game::Pickup pickup_at(b2Vec2 pos, game::PickupKind kind)
{
    game::Pickup c{};
    c.pos = pos;
    c.kind = kind;
    return c;
}

static game::Projectile shot_at(b2Vec2 pos, float damage)
{
    game::Projectile p{};
    p.pos = pos;
    p.damage = damage;
    return p;
}

static void test_pickups()
{
    auto m = test::make_quiet_match();
    m.missions.missions() = {game::MissionTracker::templates()[1]};
    assert(m.missions.missions()[0].kind == game::MissionKind::pickup_collect);
    const b2Vec2 head = m.player.head;

    m.pickups.push_back(pickup_at(head, game::PickupKind::energy));
    game::collect_pickups(m);
    assert(m.pickups[0].collected);
    assert(m.score == 25);
    assert(m.effects.has_cue(game::AudioCue::pickup));

    m.player.health = 50.f;
    m.combo = 1.f;
    m.pickups.push_back(pickup_at(head, game::PickupKind::health));
    game::collect_pickups(m);
    assert(test::near(m.player.health, 65.f));
    assert(m.score == 25 + 35);

    m.combo = 1.f;
    m.pickups.push_back(pickup_at(head, game::PickupKind::shield));
    game::collect_pickups(m);
    assert(test::near(m.player.shield, 20.f));
    assert(m.score == 25 + 35 + 30);

    // Already collected pickups are not counted twice.
    assert(m.stats.pickups_collected == 3);
    assert(m.missions.missions()[0].progress == 3.f);

    // Just outside the collection radius.
    m.pickups.push_back(pickup_at({head.x + 18.f, head.y}, game::PickupKind::energy));
    game::collect_pickups(m);
    assert(!m.pickups.back().collected);

    game::compact_collections(m);
    assert(m.pickups.size() == 1);
    std::cout << "pickups OK" << std::endl;
}

static void test_player_shot_hits_first_enemy_only()
{
    auto m = test::make_quiet_match();
    game::spawn_enemy_at(m, game::EnemyKind::drone, {200.f, 200.f});
    game::spawn_enemy_at(m, game::EnemyKind::drone, {202.f, 200.f});
    m.projectiles.push_back(shot_at({200.f, 200.f}, 1.f));

    game::resolve_player_projectiles(m);
    assert(!m.projectiles[0].alive);
    assert(m.enemies[0].health == m.enemies[0].max_health - 1.f);
    assert(m.enemies[1].health == m.enemies[1].max_health);
    std::cout << "first hit OK" << std::endl;
}

static void test_enemy_contact()
{
    auto m = test::make_quiet_match();
    m.combo = 3.f;
    auto &e = game::spawn_enemy_at(m, game::EnemyKind::drone, m.player.head);
    float expected = e.contact_damage * test::k_dt * m.tuning.contact_damage_scale;

    game::resolve_enemy_contact(m, test::k_dt);
    assert(test::near(m.player.health, 100.f - expected));
    assert(m.took_damage_this_level);
    assert(m.combo == 1.f);
    assert(m.camera_shake == 7.f);
    assert(m.player.invuln_timer > 0.f);
    assert(m.effects.has_cue(game::AudioCue::hit));
    std::cout << "contact OK" << std::endl;
}

static void test_enemy_shot()
{
    auto m = test::make_quiet_match();
    m.combo = 3.f;
    m.enemy_projectiles.push_back(shot_at(m.player.head, 12.f));
    // Outside the 10 unit head radius used for incoming shots.
    m.enemy_projectiles.push_back(shot_at({m.player.head.x, m.player.head.y + 15.5f}, 12.f));

    game::resolve_enemy_projectiles(m);
    assert(!m.enemy_projectiles[0].alive);
    assert(m.enemy_projectiles[1].alive);
    assert(test::near(m.player.health, 88.f));
    assert(m.took_damage_this_level);
    assert(m.combo == 1.f);
    assert(m.camera_shake == 5.f);
    std::cout << "enemy shot OK" << std::endl;
}

static void test_invulnerable_hits_leave_state()
{
    auto m = test::make_quiet_match();
    m.player.invuln_timer = 0.1f;
    m.combo = 3.f;
    game::spawn_enemy_at(m, game::EnemyKind::drone, m.player.head);
    m.enemy_projectiles.push_back(shot_at(m.player.head, 12.f));

    game::resolve_collisions(m, test::k_dt);
    assert(m.player.health == 100.f);
    assert(m.combo == 3.f);
    assert(!m.took_damage_this_level);
    assert(m.camera_shake == 0.f);
    assert(m.enemy_projectiles.empty()); // the shot is still consumed
    std::cout << "invulnerable OK" << std::endl;
}

int main()
{
    test_pickups();
    test_player_shot_hits_first_enemy_only();
    test_enemy_contact();
    test_enemy_shot();
    test_invulnerable_hits_leave_state();
    std::cout << "unit_collision OK" << std::endl;
    return 0;
}
