// SPDX-License-Identifier: Apache-2.0
#include "game/entities.hpp"

#include <cmath>

namespace serpent::game {

namespace {

// clang-format off
constexpr Archetype k_drone{
    14.f, 20.f, 85.f, 10.f, 40, 0xff6f8a,
    1.f, 0.f, 0.f, 0.f,
    {},
    1, 22, 3.f};
constexpr Archetype k_runner{
    10.f, 14.f, 140.f, 7.f, 45, 0xffad5b,
    1.f, 0.f, 0.f, 0.f,
    {},
    1, 22, 3.f};
constexpr Archetype k_tank{
    18.f, 44.f, 56.f, 17.f, 85, 0xff6262,
    0.03f, 0.f, 0.f, 0.f,
    {},
    1, 22, 3.f};
constexpr Archetype k_sniper{
    12.f, 18.f, 76.f, 8.f, 60, 0xbd89ff,
    1.f, 210.f, 14.f, 16.f,
    {true, 1.4f, 2.2f, 250.f, 12.f, 4.f, 2.6f, 0xf4a2ff, 1},
    1, 22, 3.f};
constexpr Archetype k_boss{
    40.f, 320.f, 48.f, 22.f, 950, 0xff3b73,
    0.015f, 0.f, 0.f, 0.f,
    {true, 1.15f, 1.15f, 190.f, 10.f, 5.f, 3.f, 0xff8ca2, 12},
    4, 60, 5.f};
// clang-format on

} // namespace

const char *enemy_kind_name(EnemyKind kind)
{
    switch (kind) {
        case EnemyKind::drone:
            return "drone";
        case EnemyKind::runner:
            return "runner";
        case EnemyKind::tank:
            return "tank";
        case EnemyKind::sniper:
            return "sniper";
        case EnemyKind::boss:
            return "boss";
    }
    return "drone";
}

const Archetype &archetype(EnemyKind kind)
{
    switch (kind) {
        case EnemyKind::runner:
            return k_runner;
        case EnemyKind::tank:
            return k_tank;
        case EnemyKind::sniper:
            return k_sniper;
        case EnemyKind::boss:
            return k_boss;
        case EnemyKind::drone:
            break;
    }
    return k_drone;
}

float level_scale(uint32_t level, float per_level)
{
    float l = level > 0 ? static_cast<float>(level - 1) : 0.f;
    return 1.f + l * per_level;
}

Enemy make_enemy(EnemyKind kind, b2Vec2 pos, float scale, float initial_fire_cooldown)
{
    const Archetype &a = archetype(kind);
    Enemy e{};
    e.kind = kind;
    e.pos = pos;
    e.radius = a.radius;
    // Health, contact damage and speed scale along separate curves.
    e.max_health = std::round(a.max_health * scale);
    e.health = e.max_health;
    e.contact_damage = std::round(a.contact_damage * (0.7f + scale * 0.4f));
    e.speed = a.speed * (0.85f + scale * 0.2f);
    e.fire_cooldown = initial_fire_cooldown;
    e.score_value = a.score_value;
    e.color = a.color;
    return e;
}

void damage_enemy(Enemy &e, float amount)
{
    e.health -= amount;
    if (e.health > e.max_health)
        e.health = e.max_health;
    if (e.health <= 0.f)
        e.alive = false;
}

void step_projectile(Projectile &p, float dt, const phys::Bounds &bounds, float margin)
{
    p.ttl -= dt;
    p.pos = phys::integrate(p.pos, p.vel, dt);
    if (p.ttl <= 0.f || phys::outside_bounds(p.pos, bounds, margin))
        p.alive = false;
}

void step_mine(Mine &m, float dt)
{
    m.arm_timer -= dt;
    m.ttl -= dt;
    if (m.ttl <= 0.f)
        m.alive = false;
}

const char *pickup_kind_name(PickupKind kind)
{
    switch (kind) {
        case PickupKind::energy:
            return "energy";
        case PickupKind::health:
            return "health";
        case PickupKind::shield:
            return "shield";
    }
    return "energy";
}

uint32_t pickup_color(PickupKind kind)
{
    switch (kind) {
        case PickupKind::health:
            return 0x8bff96;
        case PickupKind::shield:
            return 0x95aaff;
        case PickupKind::energy:
            break;
    }
    return 0x7cf7ff;
}

} // namespace serpent::game
