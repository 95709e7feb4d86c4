// SPDX-License-Identifier: Apache-2.0
#include "headless/session_loop.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game/match.hpp"
#include "game/snapshot.hpp"
#include "headless/autopilot.hpp"
#include "serpent.pb.h"

#include <chrono>
#include <string>

namespace serpent::headless {

namespace {

void publish_gauges(const game::MatchState &m)
{
    auto &rt = metrics::runtime();
    rt.enemies_active.store(m.enemies.size(), std::memory_order_relaxed);
    rt.projectiles_active.store(m.projectiles.size(), std::memory_order_relaxed);
    rt.enemy_projectiles_active.store(m.enemy_projectiles.size(), std::memory_order_relaxed);
    rt.mines_active.store(m.mines.size(), std::memory_order_relaxed);
    rt.pickups_active.store(m.pickups.size(), std::memory_order_relaxed);
    metrics::note_level(m.level);
}

} // namespace

size_t drain_effects(const game::FrameEffects &fx, uint64_t tick)
{
    for (auto cue : fx.cues) {
        if (cue == game::AudioCue::death || cue == game::AudioCue::level_up)
            serpent::log::debug("[fx] tick={} cue={}", tick, game::cue_name(cue));
        else
            serpent::log::trace("[fx] tick={} cue={}", tick, game::cue_name(cue));
    }
    for (auto &a : fx.announcements)
        serpent::log::info("[fx] announce '{}' for {}s", a.text, a.duration_sec);
    if (!fx.bursts.empty())
        SERPENT_LOG_EVERY_N(trace, 60, "[fx] tick={} bursts={}", tick, fx.bursts.size());
    return fx.cues.size() + fx.announcements.size() + fx.bursts.size() + fx.trails.size();
}

coro::task<void> run_session(std::shared_ptr<coro::io_scheduler> scheduler, DriverConfig cfg, std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    game::MatchState match;
    match.tuning = cfg.tuning;
    match.rng.seed(cfg.seed);
    Autopilot pilot(match);
    input::KeyboardState idle;
    input::InputSource &in = cfg.autopilot ? static_cast<input::InputSource &>(pilot) : idle;

    game::start_match(match);
    metrics::runtime().matches_started.fetch_add(1, std::memory_order_relaxed);
    serpent::log::info(
        "[session] start seed={} tick_rate={} autopilot={} duration={}s",
        cfg.seed,
        cfg.tick_rate,
        cfg.autopilot,
        cfg.duration_seconds);

    serpent::wire::FrameSnapshot snap;
    std::string snapshot_scratch;
    uint32_t kills_reported = 0;

    using clock = std::chrono::steady_clock;
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + cfg.tick_rate / 2) / cfg.tick_rate);
    const auto session_start = clock::now();
    auto next = session_start;
    auto last = session_start;
    while (!stop.load()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(wait_dur);
            continue;
        }
        if (cfg.duration_seconds > 0 && now - session_start >= std::chrono::seconds(cfg.duration_seconds)) {
            serpent::log::info("[session] duration reached ({}s); stopping", cfg.duration_seconds);
            break;
        }
        auto tick_start = now;
        float frame_dt = std::chrono::duration<float>(now - last).count();
        last = now;
        if (frame_dt > match.tuning.max_frame_dt)
            metrics::runtime().clamped_frames.fetch_add(1, std::memory_order_relaxed);
        next += tick_interval;
        // After a long stall resynchronize instead of replaying missed ticks back to back.
        if (now - next > tick_interval * 4)
            next = now + tick_interval;

        if (cfg.autopilot)
            pilot.plan();
        game::tick(match, in, frame_dt);
        drain_effects(match.effects, match.tick);
        publish_gauges(match);
        if (match.stats.kills > kills_reported) {
            metrics::runtime().enemies_killed.fetch_add(match.stats.kills - kills_reported, std::memory_order_relaxed);
            kills_reported = match.stats.kills;
        }

        if (cfg.snapshot_interval_ticks > 0 && match.tick % cfg.snapshot_interval_ticks == 0) {
            game::build_frame_snapshot(match, snap);
            snapshot_scratch.clear();
            if (snap.SerializeToString(&snapshot_scratch))
                metrics::add_snapshot(snapshot_scratch.size());
            else
                serpent::log::warn("[session] snapshot serialization failed tick={}", match.tick);
        }

        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));

        if (match.phase == game::Phase::game_over) {
            metrics::runtime().matches_lost.fetch_add(1, std::memory_order_relaxed);
            if (!cfg.restart_on_game_over)
                break;
            game::start_match(match);
            kills_reported = 0;
            metrics::runtime().matches_started.fetch_add(1, std::memory_order_relaxed);
        }
    }
    stop.store(true);
    serpent::log::info("[session] end score={} level={} ticks={}", match.score, match.level, match.tick);
    co_return;
}

coro::task<void> run_metrics_reporter(
    std::shared_ptr<coro::io_scheduler> scheduler, uint32_t interval_seconds, std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    if (interval_seconds == 0)
        co_return;
    uint32_t waited = 0;
    while (!stop.load()) {
        co_await scheduler->yield_for(std::chrono::seconds(1));
        if (++waited < interval_seconds)
            continue;
        waited = 0;
        serpent::log::info("{}", metrics::runtime_json("runtime"));
    }
    co_return;
}

} // namespace serpent::headless
