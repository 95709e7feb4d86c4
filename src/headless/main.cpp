// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "headless/driver_config.hpp"
#include "headless/session_loop.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/sync_wait.hpp>
#include <coro/when_all.hpp>
#include <google/protobuf/stubs/common.h>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <string>

namespace serpent {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    serpent::g_shutdown.store(true);
}

// Headless driver: runs the simulation at a fixed rate with the autopilot (or idle) input,
// restarting after each game over, until --duration elapses or SIGINT/SIGTERM arrives.
int main(int argc, char **argv)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    serpent::headless::DriverConfig cfg;
    std::string config_path = serpent::headless::config_path_from_args(argc, argv, "config/serpent.yaml");
    try {
        cfg = serpent::headless::load_driver_config(config_path);
        serpent::headless::apply_cli_overrides(cfg, argc, argv);
    } catch (const std::exception &ex) {
        serpent::log::init();
        serpent::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    }

    serpent::log::configure(cfg.log_level, cfg.log_json);
    serpent::log::init();
    serpent::log::info("serpent headless starting (config: {})", config_path);
    serpent::log::info("Tick rate: {} Hz", cfg.tick_rate);
    if (cfg.duration_seconds > 0)
        serpent::log::info("Auto-shutdown after {} seconds", cfg.duration_seconds);
    if (!cfg.autopilot)
        serpent::log::info("Autopilot disabled (--no-autopilot); the serpent will glide straight ahead");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto scheduler = coro::default_executor::io_executor();
    coro::sync_wait(coro::when_all(
        serpent::headless::run_session(scheduler, cfg, serpent::g_shutdown),
        serpent::headless::run_metrics_reporter(scheduler, cfg.metrics_interval_seconds, serpent::g_shutdown)));

    serpent::log::info("Shutdown complete.");
    serpent::log::info("{}", serpent::metrics::runtime_json("runtime_final"));
    google::protobuf::ShutdownProtobufLibrary();
    return 0;
}
