// SPDX-License-Identifier: Apache-2.0
#include "game/snapshot.hpp"

#include "game/hud.hpp"

#include <algorithm>

namespace serpent::game {

namespace {

void set_vec(serpent::wire::Vec2 *out, b2Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

serpent::wire::Phase to_wire(Phase p)
{
    switch (p) {
        case Phase::menu:
            return serpent::wire::PHASE_MENU;
        case Phase::running:
            return serpent::wire::PHASE_RUNNING;
        case Phase::paused:
            return serpent::wire::PHASE_PAUSED;
        case Phase::game_over:
            return serpent::wire::PHASE_GAME_OVER;
    }
    return serpent::wire::PHASE_MENU;
}

serpent::wire::EnemyKind to_wire(EnemyKind k)
{
    switch (k) {
        case EnemyKind::drone:
            return serpent::wire::ENEMY_DRONE;
        case EnemyKind::runner:
            return serpent::wire::ENEMY_RUNNER;
        case EnemyKind::tank:
            return serpent::wire::ENEMY_TANK;
        case EnemyKind::sniper:
            return serpent::wire::ENEMY_SNIPER;
        case EnemyKind::boss:
            return serpent::wire::ENEMY_BOSS;
    }
    return serpent::wire::ENEMY_DRONE;
}

serpent::wire::PickupKind to_wire(PickupKind k)
{
    switch (k) {
        case PickupKind::energy:
            return serpent::wire::PICKUP_ENERGY;
        case PickupKind::health:
            return serpent::wire::PICKUP_HEALTH;
        case PickupKind::shield:
            return serpent::wire::PICKUP_SHIELD;
    }
    return serpent::wire::PICKUP_ENERGY;
}

void add_projectile(serpent::wire::FrameSnapshot &out, const Projectile &p, bool hostile)
{
    auto *ps = out.add_projectiles();
    set_vec(ps->mutable_pos(), p.pos);
    ps->set_radius(p.radius);
    ps->set_color(p.color);
    ps->set_hostile(hostile);
}

} // namespace

float cooldown_ratio(float remaining, float max)
{
    if (max <= 0.f)
        return 1.f;
    return std::clamp(1.f - remaining / max, 0.f, 1.f);
}

void build_frame_snapshot(const MatchState &m, serpent::wire::FrameSnapshot &out)
{
    const Tuning &t = m.tuning;
    const Player &p = m.player;
    out.Clear();
    out.set_tick(m.tick);
    out.set_phase(to_wire(m.phase));
    out.set_world_width(m.bounds.width);
    out.set_world_height(m.bounds.height);
    out.set_camera_shake(m.camera_shake);
    out.set_time_dilated(p.burst_active());

    auto *ps = out.mutable_player();
    set_vec(ps->mutable_head(), p.head);
    set_vec(ps->mutable_dir(), p.dir);
    ps->set_health(p.health);
    ps->set_max_health(p.max_health);
    ps->set_shield(p.shield);
    ps->set_invulnerable(p.invuln_timer > 0.f);
    ps->set_dash_active(p.dash_active());
    ps->set_burst_active(p.burst_active());
    ps->set_length(p.length);
    for (auto &s : p.segments)
        set_vec(ps->add_segments(), s);
    auto *cd = ps->mutable_cooldowns();
    cd->set_primary(cooldown_ratio(p.primary_cooldown, t.primary_cooldown_sec));
    cd->set_dash(cooldown_ratio(p.dash_cooldown, t.dash_cooldown_sec));
    cd->set_burst(cooldown_ratio(p.burst_cooldown, t.burst_cooldown_sec));
    cd->set_mine(cooldown_ratio(p.mine_cooldown, t.mine_cooldown_sec));

    for (auto &e : m.enemies) {
        auto *es = out.add_enemies();
        es->set_id(e.id);
        es->set_kind(to_wire(e.kind));
        set_vec(es->mutable_pos(), e.pos);
        es->set_radius(e.radius);
        es->set_color(e.color);
        es->set_health_ratio(e.max_health > 0.f ? std::clamp(e.health / e.max_health, 0.f, 1.f) : 0.f);
    }
    for (auto &pr : m.projectiles)
        add_projectile(out, pr, false);
    for (auto &pr : m.enemy_projectiles)
        add_projectile(out, pr, true);
    for (auto &mine : m.mines) {
        auto *ms = out.add_mines();
        set_vec(ms->mutable_pos(), mine.pos);
        ms->set_radius(mine.radius);
        ms->set_armed(mine.armed());
    }
    for (auto &c : m.pickups) {
        auto *cs = out.add_pickups();
        set_vec(cs->mutable_pos(), c.pos);
        cs->set_radius(c.radius);
        cs->set_kind(to_wire(c.kind));
        cs->set_color(pickup_color(c.kind));
    }

    HudValues hud = build_hud(m);
    auto *hs = out.mutable_hud();
    hs->set_score(hud.score);
    hs->set_level(hud.level);
    hs->set_health(hud.health);
    hs->set_shield(hud.shield);
    hs->set_combo(hud.combo);
    for (auto &line : hud.missions)
        hs->add_missions(line);
}

} // namespace serpent::game
