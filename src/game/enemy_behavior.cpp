// SPDX-License-Identifier: Apache-2.0
#include "game/enemy_behavior.hpp"

#include "common/logger.hpp"

#include <cmath>

namespace serpent::game {

namespace {

constexpr float k_two_pi = 6.28318530717958647692f;
constexpr float k_sniper_brake = 0.92f;

void pursue(Enemy &e, b2Vec2 dir)
{
    e.vel = b2MulSV(e.speed, dir);
}

void pursue_heavy(Enemy &e, b2Vec2 dir, float blend)
{
    e.vel = b2Lerp(e.vel, b2MulSV(e.speed, dir), blend);
}

void keep_standoff(Enemy &e, const Archetype &a, const phys::Separation &sep)
{
    if (sep.distance > a.standoff + a.standoff_far_slack)
        e.vel = b2MulSV(e.speed, sep.dir);
    else if (sep.distance < a.standoff - a.standoff_near_slack)
        e.vel = b2MulSV(-e.speed, sep.dir);
    else
        e.vel = b2MulSV(k_sniper_brake, e.vel);
}

Projectile make_shot(const Enemy &e, const WeaponSpec &w, b2Vec2 dir)
{
    Projectile p{};
    p.pos = e.pos;
    p.vel = b2MulSV(w.projectile_speed, dir);
    p.damage = w.projectile_damage;
    p.radius = w.projectile_radius;
    p.ttl = w.projectile_ttl;
    p.color = w.projectile_color;
    return p;
}

uint32_t fire_if_ready(Enemy &e, const Archetype &a, b2Vec2 aim, float dt, EnemyStepContext &ctx)
{
    const WeaponSpec &w = a.weapon;
    e.fire_cooldown -= dt;
    if (e.fire_cooldown > 0.f)
        return 0;
    e.fire_cooldown =
        w.cooldown_max > w.cooldown_min ? rand_range(ctx.rng, w.cooldown_min, w.cooldown_max) : w.cooldown_min;
    if (w.volley <= 1) {
        ctx.enemy_projectiles.push_back(make_shot(e, w, aim));
        ctx.effects.burst(e.pos, 8, w.projectile_color, 95.f, 2.4f);
        return 1;
    }
    for (uint32_t i = 0; i < w.volley; ++i) {
        float ang = k_two_pi * static_cast<float>(i) / static_cast<float>(w.volley);
        ctx.enemy_projectiles.push_back(make_shot(e, w, phys::from_angle(ang)));
    }
    serpent::log::trace("[enemy] id={} {} radial volley x{}", e.id, enemy_kind_name(e.kind), w.volley);
    return w.volley;
}

} // namespace

uint32_t step_enemy(Enemy &e, float dt, EnemyStepContext &ctx)
{
    const Archetype &a = archetype(e.kind);
    phys::Separation sep = phys::separation(e.pos, ctx.target);
    uint32_t fired = 0;
    switch (e.kind) {
        case EnemyKind::runner:
            pursue(e, sep.dir);
            break;
        case EnemyKind::tank:
            pursue_heavy(e, sep.dir, a.steer_blend);
            break;
        case EnemyKind::sniper:
            keep_standoff(e, a, sep);
            fired = fire_if_ready(e, a, sep.dir, dt, ctx);
            break;
        case EnemyKind::boss:
            pursue_heavy(e, sep.dir, a.steer_blend);
            fired = fire_if_ready(e, a, sep.dir, dt, ctx);
            break;
        case EnemyKind::drone:
            pursue(e, sep.dir);
            break;
    }
    e.pos = phys::clamp_position(phys::integrate(e.pos, e.vel, dt), e.radius, ctx.bounds);
    return fired;
}

} // namespace serpent::game
