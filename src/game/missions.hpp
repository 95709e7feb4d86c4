// SPDX-License-Identifier: Apache-2.0
// missions.hpp - Per-level objectives: template pool, concurrent progress tracking, one-time rewards
#pragma once
#include "game/random.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace serpent::game {

// Which game signal drives a mission.
enum class MissionKind : uint8_t
{
    runner_kills, // event: runner destroyed
    pickup_collect, // event: core absorbed
    seconds_no_hit, // passive: elapsed time while the level's damage flag is unset
    mine_kills, // event: enemy destroyed by a mine blast
    combo_peak // passive: combo tier high-water mark
};

const char *mission_kind_name(MissionKind kind);

struct Mission
{
    std::string id;
    std::string text;
    float target{1.f};
    MissionKind kind{MissionKind::runner_kills};
    float progress{0.f};
    std::optional<float> timer; // countdown (timed missions only)
    float timer_start{0.f};
    bool done{false};
    bool failed{false};
    int64_t reward{180};

    bool terminal() const { return done || failed; }

    void increment(float amount);
    // "<text>: <progress>/<target> (<timer>s)" while active, "<text> [DONE]" / "<text> [FAILED]" once terminal.
    std::string display_text() const;
};

// Number of missions drawn for a level (2, or 3 on every third level).
uint32_t missions_for_level(uint32_t level);

class MissionTracker
{
public:
    // Fresh copies of every mission template.
    static std::vector<Mission> templates();

    // Replace the active set with a shuffled draw for the level.
    void start_level(uint32_t level, Rng &rng);
    // Advance timers and passive missions. Terminal missions are never touched.
    void update(float dt, bool took_damage_this_level, uint32_t combo_tier);
    // Event-driven increment for every active mission of the kind.
    void on_event(MissionKind kind, float amount = 1.f);
    // Sum of rewards over completed missions.
    int64_t reward_total() const;

    const std::vector<Mission> &missions() const { return m_missions; }

    std::vector<Mission> &missions() { return m_missions; }

private:
    std::vector<Mission> m_missions;
};

} // namespace serpent::game
