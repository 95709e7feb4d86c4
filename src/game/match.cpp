// SPDX-License-Identifier: Apache-2.0
#include "game/match.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "game/collision.hpp"
#include "game/enemy_behavior.hpp"
#include "game/progression.hpp"

#include <algorithm>

namespace serpent::game {

const char *phase_name(Phase phase)
{
    switch (phase) {
        case Phase::menu:
            return "menu";
        case Phase::running:
            return "running";
        case Phase::paused:
            return "paused";
        case Phase::game_over:
            return "game_over";
    }
    return "unknown";
}

void reset_match(MatchState &m)
{
    const Tuning &t = m.tuning;
    m.bounds = {t.world_width, t.world_height};
    m.phase = Phase::menu;
    m.tick = 0;
    m.elapsed = 0.f;
    m.wave_time = 0.f;
    m.player = make_player({t.world_width * 0.5f, t.world_height * 0.5f}, t);
    m.enemies.clear();
    m.projectiles.clear();
    m.enemy_projectiles.clear();
    m.mines.clear();
    m.pickups.clear();
    m.next_enemy_id = 1;
    m.score = 0;
    m.level = 1;
    m.xp = 0.f;
    m.combo = 1.f;
    m.combo_timer = 0.f;
    m.combo_tier = 1;
    m.took_damage_this_level = false;
    m.missions.start_level(1, m.rng);
    m.spawn_timer = 0.f;
    m.pickup_spawn_timer = t.pickup_first_spawn_sec;
    m.camera_shake = 0.f;
    m.effects.clear();
    m.stats = {};
}

void start_match(MatchState &m)
{
    reset_match(m);
    m.phase = Phase::running;
    serpent::log::info(
        "[match] start world={}x{} missions={}", m.bounds.width, m.bounds.height, m.missions.missions().size());
}

void toggle_pause(MatchState &m)
{
    if (m.phase == Phase::running)
        m.phase = Phase::paused;
    else if (m.phase == Phase::paused)
        m.phase = Phase::running;
    else
        return;
    serpent::log::debug("[match] phase={} tick={}", phase_name(m.phase), m.tick);
}

float world_time_scale(const MatchState &m)
{
    return m.player.burst_active() ? m.tuning.burst_time_scale : 1.f;
}

void tick(MatchState &m, input::InputSource &in, float frame_dt)
{
    m.effects.clear();
    if ((m.phase == Phase::running || m.phase == Phase::paused) && in.consume(input::key::pause))
        toggle_pause(m);
    if (m.phase != Phase::running) {
        in.end_frame();
        return;
    }

    const Tuning &t = m.tuning;
    const float dt = std::clamp(frame_dt, 0.f, t.max_frame_dt);
    // Sampled before the player update so a burst triggered this frame dilates from the next frame on.
    const float world_dt = dt * world_time_scale(m);
    m.tick++;

    m.elapsed += dt;
    m.wave_time += world_dt;
    m.spawn_timer -= world_dt;
    m.pickup_spawn_timer -= world_dt;
    relax_combo(m, dt);

    PlayerActions acts =
        update_player(m.player, in, dt, t, m.bounds, PlayerOutputs{m.projectiles, m.mines, m.effects});
    if (acts.mine)
        m.stats.mines_dropped++;

    run_spawners(m);

    EnemyStepContext ctx{m.player.head, m.bounds, m.rng, m.enemy_projectiles, m.effects};
    for (auto &e : m.enemies) {
        if (step_enemy(e, world_dt, ctx) > 0)
            m.stats.volleys_fired++;
    }
    for (auto &p : m.projectiles)
        step_projectile(p, dt, m.bounds, t.world_margin);
    for (auto &p : m.enemy_projectiles)
        step_projectile(p, world_dt, m.bounds, t.world_margin);
    for (auto &mine : m.mines)
        step_mine(mine, dt);

    resolve_collisions(m, dt);
    m.missions.update(dt, m.took_damage_this_level, m.combo_tier);

    m.camera_shake = std::max(0.f, m.camera_shake - t.camera_shake_decay * dt);

    SERPENT_LOG_EVERY_N(
        trace,
        120,
        "[tick] n={} level={} score={} enemies={} projectiles={} hp={}",
        m.tick,
        m.level,
        m.score,
        m.enemies.size(),
        m.projectiles.size() + m.enemy_projectiles.size(),
        m.player.health);

    if (m.player.health <= 0.f) {
        m.phase = Phase::game_over;
        m.effects.cue(AudioCue::death);
        serpent::log::info(
            "[match] game over score={} level={} kills={} elapsed={}s", m.score, m.level, m.stats.kills, m.elapsed);
    }
    in.end_frame();
}

} // namespace serpent::game
