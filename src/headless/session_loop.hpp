// SPDX-License-Identifier: Apache-2.0
// session_loop.hpp - Fixed-rate coroutine driving the simulation without a renderer
#pragma once
#include "game/effects.hpp"
#include "headless/driver_config.hpp"

#include <coro/io_scheduler.hpp>
#include <coro/task.hpp>

#include <atomic>
#include <memory>

namespace serpent::headless {

// Presentation stand-in: forwards the per-tick effects to the log. Returns the number of entries drained.
size_t drain_effects(const game::FrameEffects &fx, uint64_t tick);

// Runs matches back to back at cfg.tick_rate until `stop` is set or cfg.duration_seconds elapse.
// Sets `stop` itself when it finishes so sibling tasks wind down too.
coro::task<void> run_session(std::shared_ptr<coro::io_scheduler> scheduler, DriverConfig cfg, std::atomic_bool &stop);

// Emits metrics::runtime_json every cfg.metrics_interval_seconds until `stop` is set.
coro::task<void> run_metrics_reporter(
    std::shared_ptr<coro::io_scheduler> scheduler, uint32_t interval_seconds, std::atomic_bool &stop);

} // namespace serpent::headless
