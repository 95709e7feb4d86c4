// SPDX-License-Identifier: Apache-2.0
#include "game/player.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>

namespace serpent::game {

namespace {

constexpr uint32_t k_head_color = 0x6cefff;
constexpr uint32_t k_burst_color = 0xa08cff;
constexpr uint32_t k_dash_color = 0xa6f7ff;
constexpr uint32_t k_shot_color = 0x87faff;
// Trail samples kept per body segment, and the sample stride between segments.
constexpr uint32_t k_trail_per_segment = 14;
constexpr float k_segment_stride = 10.f;
constexpr float k_segment_follow = 0.65f;

void count_down(float &timer, float dt)
{
    timer = std::max(0.f, timer - dt);
}

void follow_trail(Player &p)
{
    p.trail.push_front(p.head);
    size_t max_trail = std::max<size_t>(1, static_cast<size_t>(p.length) * k_trail_per_segment);
    if (p.trail.size() > max_trail)
        p.trail.resize(max_trail);
    for (size_t i = 0; i < p.segments.size(); ++i) {
        size_t idx = std::min(p.trail.size() - 1, static_cast<size_t>(std::floor((i + 1) * k_segment_stride)));
        p.segments[i] = b2Lerp(p.segments[i], p.trail[idx], k_segment_follow);
    }
}

void fire_primary(Player &p, const Tuning &t, std::vector<Projectile> &out)
{
    float base = std::atan2(p.dir.y, p.dir.x);
    for (int i = -1; i <= 1; ++i) {
        b2Vec2 d = phys::from_angle(base + static_cast<float>(i) * t.primary_spread_rad);
        Projectile pr{};
        pr.pos = p.head;
        pr.vel = b2MulSV(t.primary_projectile_speed, d);
        pr.damage = t.primary_projectile_damage;
        pr.radius = t.primary_projectile_radius;
        pr.ttl = t.primary_projectile_ttl;
        pr.color = k_shot_color;
        out.push_back(pr);
    }
}

} // namespace

Player make_player(b2Vec2 pos, const Tuning &t)
{
    Player p{};
    p.head = pos;
    p.max_health = t.player_max_health;
    p.health = t.player_max_health;
    p.length = t.player_start_length;
    p.speed = t.player_base_speed;
    p.segments.reserve(p.length);
    for (uint32_t i = 0; i < p.length; ++i)
        p.segments.push_back({pos.x - static_cast<float>(i) * t.player_segment_spacing, pos.y});
    return p;
}

float speed_multiplier(const Player &p, const Tuning &t)
{
    float m = 1.f;
    if (p.dash_active())
        m *= t.dash_speed_mult;
    if (p.burst_active())
        m *= t.burst_speed_mult;
    return m;
}

float movement_speed(const Player &p, const Tuning &t)
{
    float grown = static_cast<float>(p.length) - static_cast<float>(t.player_start_length);
    return (t.player_base_speed + grown * t.player_speed_per_segment) * speed_multiplier(p, t);
}

float apply_damage(Player &p, float amount, const Tuning &t)
{
    if (p.invuln_timer > 0.f || amount <= 0.f)
        return 0.f;
    float remaining = amount;
    if (p.shield > 0.f) {
        float absorbed = std::min(p.shield, remaining);
        p.shield -= absorbed;
        remaining -= absorbed;
    }
    if (remaining > 0.f)
        p.health = std::max(0.f, p.health - remaining);
    p.invuln_timer = t.invulnerability_window_sec;
    return amount;
}

void heal(Player &p, float amount)
{
    p.health = std::clamp(p.health + amount, 0.f, p.max_health);
}

void add_shield(Player &p, float amount, const Tuning &t)
{
    p.shield = std::clamp(p.shield + amount, 0.f, t.player_max_shield);
}

void grow(Player &p, uint32_t amount)
{
    p.length += amount;
    for (uint32_t i = 0; i < amount; ++i) {
        b2Vec2 tail = p.segments.empty() ? p.head : p.segments.back();
        p.segments.push_back(tail);
    }
}

void aim_from_input(Player &p, const input::InputSource &in)
{
    using namespace input;
    float x = 0.f;
    float y = 0.f;
    if (in.is_down({key::arrow_up, key::up}))
        y -= 1.f;
    if (in.is_down({key::arrow_down, key::down}))
        y += 1.f;
    if (in.is_down({key::arrow_left, key::left}))
        x -= 1.f;
    if (in.is_down({key::arrow_right, key::right}))
        x += 1.f;
    if (x != 0.f || y != 0.f)
        p.target_dir = phys::normalize_or_zero({x, y});
}

PlayerActions update_player(
    Player &p, input::InputSource &in, float dt, const Tuning &t, const phys::Bounds &bounds, PlayerOutputs out)
{
    PlayerActions acts{};
    aim_from_input(p, in);

    b2Vec2 blended = b2Lerp(p.dir, p.target_dir, phys::smoothing_factor(t.player_turn_rate, dt));
    // Exactly opposite directions can cancel out; fall back to the target instead of a zero vector.
    p.dir = b2Length(blended) > 0.f ? phys::normalize_or_zero(blended) : p.target_dir;

    count_down(p.invuln_timer, dt);
    count_down(p.primary_cooldown, dt);
    count_down(p.dash_cooldown, dt);
    count_down(p.burst_cooldown, dt);
    count_down(p.mine_cooldown, dt);
    count_down(p.dash_time, dt);
    count_down(p.burst_time, dt);

    if (in.consume(input::key::dash) && p.dash_cooldown <= 0.f) {
        p.dash_cooldown = t.dash_cooldown_sec;
        p.dash_time = t.dash_duration_sec;
        out.effects.cue(AudioCue::dash);
        out.effects.burst(p.head, 18, k_dash_color, 190.f, 3.f);
        acts.dashed = true;
    }
    if (in.consume(input::key::burst) && p.burst_cooldown <= 0.f) {
        p.burst_cooldown = t.burst_cooldown_sec;
        p.burst_time = t.burst_duration_sec;
        out.effects.burst(p.head, 25, k_burst_color, 240.f, 4.f);
        acts.burst = true;
        serpent::log::debug("[player] temporal burst for {}s", t.burst_duration_sec);
    }
    if (in.consume(input::key::mine) && p.mine_cooldown <= 0.f) {
        p.mine_cooldown = t.mine_cooldown_sec;
        Mine m{};
        m.pos = p.head;
        m.radius = t.mine_radius;
        m.arm_timer = t.mine_arm_sec;
        m.ttl = t.mine_ttl_sec;
        out.mines.push_back(m);
        acts.mine = true;
    }
    if (in.consume(input::key::fire) && p.primary_cooldown <= 0.f) {
        p.primary_cooldown = t.primary_cooldown_sec;
        fire_primary(p, t, out.projectiles);
        out.effects.cue(AudioCue::shoot);
        acts.fired = true;
    }

    p.speed = movement_speed(p, t);
    p.head = phys::wrap_position(phys::integrate(p.head, b2MulSV(p.speed, p.dir), dt), bounds);
    follow_trail(p);
    out.effects.trails.push_back({p.head, p.burst_active() ? k_burst_color : k_head_color});
    return acts;
}

} // namespace serpent::game
