// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation) sampled by the headless driver.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace serpent::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick durations (base 50us) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 50'000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // Frames whose wall-clock delta exceeded the simulation clamp.
    std::atomic<uint64_t> clamped_frames{0};
    // Live entity gauges (last tick)
    std::atomic<uint64_t> enemies_active{0};
    std::atomic<uint64_t> projectiles_active{0};
    std::atomic<uint64_t> enemy_projectiles_active{0};
    std::atomic<uint64_t> mines_active{0};
    std::atomic<uint64_t> pickups_active{0};
    // Match counters
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> matches_lost{0};
    std::atomic<uint64_t> highest_level{0};
    std::atomic<uint64_t> enemies_killed{0};
};

struct SnapshotCounters
{
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> count{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline SnapshotCounters &snapshot()
{
    static SnapshotCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (RuntimeCounters::TICK_BUCKET_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BUCKET_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline void add_snapshot(uint64_t bytes)
{
    snapshot().bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().count.fetch_add(1, std::memory_order_relaxed);
}

inline void note_level(uint64_t level)
{
    auto &hl = runtime().highest_level;
    uint64_t prev = hl.load(std::memory_order_relaxed);
    while (level > prev && !hl.compare_exchange_weak(prev, level, std::memory_order_relaxed)) {
        // loop
    }
}

// One JSON line summarizing the counters (tag distinguishes periodic vs final dumps).
inline std::string runtime_json(const char *tag)
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    uint64_t wait_samples = rt.wait_samples.load(std::memory_order_relaxed);
    uint64_t wait_mean_ns = wait_samples ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / wait_samples : 0;
    uint64_t snap_count = snapshot().count.load(std::memory_order_relaxed);
    uint64_t snap_mean = snap_count ? snapshot().bytes.load(std::memory_order_relaxed) / snap_count : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << '"';
    j << ",\"ticks\":" << samples;
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << approx_tick_p99();
    j << ",\"wait_mean_ns\":" << wait_mean_ns;
    j << ",\"clamped_frames\":" << rt.clamped_frames.load(std::memory_order_relaxed);
    j << ",\"enemies_active\":" << rt.enemies_active.load(std::memory_order_relaxed);
    j << ",\"projectiles_active\":" << rt.projectiles_active.load(std::memory_order_relaxed);
    j << ",\"enemy_projectiles_active\":" << rt.enemy_projectiles_active.load(std::memory_order_relaxed);
    j << ",\"mines_active\":" << rt.mines_active.load(std::memory_order_relaxed);
    j << ",\"pickups_active\":" << rt.pickups_active.load(std::memory_order_relaxed);
    j << ",\"matches_started\":" << rt.matches_started.load(std::memory_order_relaxed);
    j << ",\"matches_lost\":" << rt.matches_lost.load(std::memory_order_relaxed);
    j << ",\"highest_level\":" << rt.highest_level.load(std::memory_order_relaxed);
    j << ",\"enemies_killed\":" << rt.enemies_killed.load(std::memory_order_relaxed);
    j << ",\"snapshot_count\":" << snap_count;
    j << ",\"snapshot_mean_bytes\":" << snap_mean;
    j << "}";
    return j.str();
}

} // namespace serpent::metrics
