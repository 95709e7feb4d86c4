// SPDX-License-Identifier: Apache-2.0
#include "game/collision.hpp"

#include "common/logger.hpp"
#include "game/progression.hpp"

#include <algorithm>

namespace serpent::game {

namespace {

constexpr uint32_t k_pickup_burst_color = 0x9bf7ff;
constexpr uint32_t k_impact_color = 0x8fffff;
constexpr uint32_t k_mine_blast_color = 0xffaf8f;
constexpr uint32_t k_player_hit_color = 0xff8094;
constexpr float k_contact_shake = 7.f;
constexpr float k_projectile_shake = 5.f;

// Alive-flag compaction. std::erase_if is stable, so surviving entities keep their iteration order.
template <typename T, typename Pred>
void compact(std::vector<T> &v, Pred keep)
{
    std::erase_if(v, [&](const T &x) { return !keep(x); });
}

} // namespace

float mine_blast_damage(float distance, const Tuning &t)
{
    return t.mine_blast_damage - distance * t.mine_blast_falloff;
}

void reward_kill(MatchState &m, const Enemy &e, bool by_mine)
{
    const Archetype &a = archetype(e.kind);
    m.effects.burst(e.pos, a.death_particles, e.color, 220.f, a.death_particle_size);
    gain_score(m, static_cast<float>(e.score_value));
    grow(m.player, a.growth);
    m.effects.cue(AudioCue::hit);
    m.stats.kills++;
    if (e.kind == EnemyKind::runner)
        m.missions.on_event(MissionKind::runner_kills, 1.f);
    if (by_mine) {
        m.stats.mine_kills++;
        m.missions.on_event(MissionKind::mine_kills, 1.f);
    }
    if (e.kind == EnemyKind::boss) {
        m.stats.bosses_killed++;
        serpent::log::info("[kill] boss id={} level={} by_mine={}", e.id, m.level, by_mine);
    } else {
        serpent::log::debug("[kill] id={} kind={} by_mine={} combo={}", e.id, enemy_kind_name(e.kind), by_mine, m.combo);
    }
}

void collect_pickups(MatchState &m)
{
    Player &p = m.player;
    const Tuning &t = m.tuning;
    for (auto &c : m.pickups) {
        if (c.collected || b2Distance(c.pos, p.head) >= t.pickup_collect_radius)
            continue;
        c.collected = true;
        switch (c.kind) {
            case PickupKind::energy:
                gain_score(m, c.value);
                break;
            case PickupKind::health:
                heal(p, 15.f);
                gain_score(m, c.value + 10.f);
                break;
            case PickupKind::shield:
                add_shield(p, 20.f, t);
                gain_score(m, c.value + 5.f);
                break;
        }
        m.stats.pickups_collected++;
        m.missions.on_event(MissionKind::pickup_collect, 1.f);
        m.effects.cue(AudioCue::pickup);
        m.effects.burst(c.pos, 18, k_pickup_burst_color, 140.f, 3.f);
    }
}

void resolve_player_projectiles(MatchState &m)
{
    for (auto &proj : m.projectiles) {
        if (!proj.alive)
            continue;
        for (auto &e : m.enemies) {
            if (!e.alive)
                continue;
            if (!phys::circles_overlap(proj.pos, proj.radius, e.pos, e.radius))
                continue;
            proj.alive = false;
            damage_enemy(e, proj.damage);
            m.effects.burst(proj.pos, 6, k_impact_color, 90.f, 2.f);
            if (!e.alive)
                reward_kill(m, e, false);
            break; // one enemy per projectile
        }
    }
}

void resolve_mines(MatchState &m)
{
    const Tuning &t = m.tuning;
    for (auto &mine : m.mines) {
        if (!mine.alive || !mine.armed())
            continue;
        auto trigger = std::find_if(m.enemies.begin(), m.enemies.end(), [&](const Enemy &e) {
            return e.alive && b2Distance(mine.pos, e.pos) < mine.radius + e.radius + t.mine_trigger_slack;
        });
        if (trigger == m.enemies.end())
            continue;
        mine.alive = false;
        m.effects.burst(mine.pos, 32, k_mine_blast_color, 230.f, 4.f);
        uint32_t hits = 0;
        for (auto &target : m.enemies) {
            if (!target.alive)
                continue;
            float d = b2Distance(mine.pos, target.pos);
            if (d >= t.mine_blast_radius + target.radius)
                continue;
            damage_enemy(target, mine_blast_damage(d, t));
            ++hits;
            if (!target.alive)
                reward_kill(m, target, true);
        }
        serpent::log::trace("[mine] detonated at ({}, {}) hits={}", mine.pos.x, mine.pos.y, hits);
    }
}

void resolve_enemy_contact(MatchState &m, float dt)
{
    Player &p = m.player;
    const Tuning &t = m.tuning;
    for (auto &e : m.enemies) {
        if (!e.alive)
            continue;
        if (!phys::circles_overlap(e.pos, e.radius, p.head, t.player_head_radius))
            continue;
        float dealt = apply_damage(p, e.contact_damage * dt * t.contact_damage_scale, t);
        if (dealt > 0.f) {
            register_player_hit(m, dealt, k_contact_shake);
            m.effects.cue(AudioCue::hit);
            m.effects.burst(p.head, 14, k_player_hit_color, 180.f, 3.f);
        }
    }
}

void resolve_enemy_projectiles(MatchState &m)
{
    Player &p = m.player;
    const Tuning &t = m.tuning;
    // The player head is treated as radius 10 for incoming shots (one less than for contact).
    const float head_radius = t.player_head_radius - 1.f;
    for (auto &proj : m.enemy_projectiles) {
        if (!proj.alive)
            continue;
        if (!phys::circles_overlap(proj.pos, proj.radius, p.head, head_radius))
            continue;
        proj.alive = false;
        float dealt = apply_damage(p, proj.damage, t);
        if (dealt > 0.f)
            register_player_hit(m, dealt, k_projectile_shake);
    }
}

void compact_collections(MatchState &m)
{
    compact(m.projectiles, [](const Projectile &p) { return p.alive; });
    compact(m.enemy_projectiles, [](const Projectile &p) { return p.alive; });
    compact(m.mines, [](const Mine &x) { return x.alive; });
    compact(m.enemies, [](const Enemy &e) { return e.alive; });
    compact(m.pickups, [](const Pickup &c) { return !c.collected; });
}

void resolve_collisions(MatchState &m, float dt)
{
    collect_pickups(m);
    resolve_player_projectiles(m);
    resolve_mines(m);
    resolve_enemy_contact(m, dt);
    resolve_enemy_projectiles(m);
    compact_collections(m);
}

} // namespace serpent::game
