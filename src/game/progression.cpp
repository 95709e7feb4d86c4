// SPDX-License-Identifier: Apache-2.0
#include "game/progression.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace serpent::game {

float xp_required(uint32_t level, const Tuning &t)
{
    return t.xp_base + static_cast<float>(level) * t.xp_per_level;
}

void gain_score(MatchState &m, float points)
{
    const Tuning &t = m.tuning;
    m.score += static_cast<int64_t>(std::lround(points * m.combo));
    m.xp += points;
    m.combo_timer = t.combo_hold_sec;
    m.combo = std::clamp(m.combo + t.combo_step, 1.f, t.combo_max);
    m.combo_tier = std::max(m.combo_tier, static_cast<uint32_t>(std::floor(m.combo)));
    if (m.xp >= xp_required(m.level, t))
        level_up(m);
}

void level_up(MatchState &m)
{
    const Tuning &t = m.tuning;
    m.xp -= xp_required(m.level, t);
    m.level += 1;
    m.took_damage_this_level = false;
    m.combo_tier = static_cast<uint32_t>(std::floor(m.combo));
    int64_t reward = m.missions.reward_total();
    m.score += reward;
    m.missions.start_level(m.level, m.rng);
    m.player.max_health += t.level_up_max_health;
    heal(m.player, t.level_up_heal);
    add_shield(m.player, t.level_up_shield, t);
    m.effects.cue(AudioCue::level_up);
    m.effects.announcements.push_back(
        {"LEVEL " + std::to_string(m.level) + "\nMission Reward: " + std::to_string(reward), t.level_banner_sec});
    serpent::log::info(
        "[level] up level={} score={} mission_reward={} max_health={}", m.level, m.score, reward, m.player.max_health);
}

void relax_combo(MatchState &m, float dt)
{
    m.combo_timer -= dt;
    if (m.combo_timer <= 0.f) {
        m.combo += (1.f - m.combo) * phys::smoothing_factor(m.tuning.combo_decay_rate, dt);
        m.combo = std::clamp(m.combo, 1.f, m.tuning.combo_max);
    }
}

void register_player_hit(MatchState &m, float dealt, float shake)
{
    m.took_damage_this_level = true;
    m.combo = 1.f;
    m.combo_timer = 0.f;
    m.camera_shake = std::max(m.camera_shake, shake);
    m.stats.damage_taken += dealt;
}

float spawn_interval(uint32_t level, const Tuning &t)
{
    float base = t.spawn_base_sec - static_cast<float>(level) * t.spawn_step_per_level;
    return std::clamp(base, t.spawn_min_sec, t.spawn_base_sec);
}

EnemyKind roll_enemy_kind(float roll)
{
    if (roll < 0.35f)
        return EnemyKind::runner;
    if (roll < 0.55f)
        return EnemyKind::sniper;
    if (roll < 0.70f)
        return EnemyKind::tank;
    return EnemyKind::drone;
}

bool boss_alive(const MatchState &m)
{
    return std::any_of(
        m.enemies.begin(), m.enemies.end(), [](const Enemy &e) { return e.alive && e.kind == EnemyKind::boss; });
}

EnemyKind choose_enemy_kind(const MatchState &m, float roll)
{
    uint32_t interval = m.tuning.boss_level_interval;
    if (interval > 0 && m.level % interval == 0 && !boss_alive(m))
        return EnemyKind::boss;
    return roll_enemy_kind(roll);
}

Enemy &spawn_enemy_at(MatchState &m, EnemyKind kind, b2Vec2 pos)
{
    float scale = level_scale(m.level, m.tuning.enemy_scale_per_level);
    Enemy e = make_enemy(kind, pos, scale, rand_range(m.rng, 0.8f, 1.6f));
    e.id = m.next_enemy_id++;
    m.enemies.push_back(e);
    if (kind == EnemyKind::boss)
        serpent::log::info("[spawn] boss id={} level={} hp={}", e.id, m.level, e.max_health);
    else
        serpent::log::trace("[spawn] enemy id={} kind={} pos=({}, {})", e.id, enemy_kind_name(kind), pos.x, pos.y);
    return m.enemies.back();
}

Enemy &spawn_enemy(MatchState &m)
{
    EnemyKind kind = choose_enemy_kind(m, rand_unit(m.rng));
    const float w = m.bounds.width;
    const float h = m.bounds.height;
    const float off = m.tuning.world_margin;
    b2Vec2 pos{0.f, 0.f};
    switch (rand_int(m.rng, 0, 3)) {
        case 0: // top
            pos = {rand_range(m.rng, 0.f, w), -off};
            break;
        case 1: // right
            pos = {w + off, rand_range(m.rng, 0.f, h)};
            break;
        case 2: // bottom
            pos = {rand_range(m.rng, 0.f, w), h + off};
            break;
        default: // left
            pos = {-off, rand_range(m.rng, 0.f, h)};
            break;
    }
    return spawn_enemy_at(m, kind, pos);
}

Pickup &spawn_pickup(MatchState &m)
{
    const float margin = m.tuning.pickup_spawn_margin;
    Pickup p{};
    p.pos = {
        rand_range(m.rng, margin, m.bounds.width - margin), rand_range(m.rng, margin, m.bounds.height - margin)};
    p.kind = static_cast<PickupKind>(rand_int(m.rng, 0, 2));
    m.pickups.push_back(p);
    return m.pickups.back();
}

void run_spawners(MatchState &m)
{
    const Tuning &t = m.tuning;
    if (m.spawn_timer <= 0.f) {
        m.spawn_timer = spawn_interval(m.level, t) * rand_range(m.rng, 1.f - t.spawn_jitter, 1.f + t.spawn_jitter);
        uint32_t amount = m.level >= t.double_spawn_level ? 2 : 1;
        for (uint32_t i = 0; i < amount; ++i)
            spawn_enemy(m);
    }
    if (m.pickup_spawn_timer <= 0.f && m.pickups.size() < t.max_pickups) {
        m.pickup_spawn_timer = rand_range(m.rng, t.pickup_spawn_min_sec, t.pickup_spawn_max_sec);
        spawn_pickup(m);
    }
}

} // namespace serpent::game
