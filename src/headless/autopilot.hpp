// SPDX-License-Identifier: Apache-2.0
// autopilot.hpp - Scripted player that feeds the input contract from the current match state
#pragma once
#include "game/input.hpp"
#include "game/match.hpp"

namespace serpent::headless {

struct AutopilotTuning
{
    // Enemies closer than this are evaded instead of chasing pickups.
    float evade_distance{120.f};
    float dash_distance{60.f};
    float mine_distance{140.f};
    uint32_t mine_min_enemies{2};
    float fire_range{420.f};
    // cos of the aim cone
    float fire_cone{0.8f};
    // Component threshold for turning a direction into held keys.
    float key_threshold{0.3f};
};

// Decides keys once per frame via plan(); the simulation then reads them through InputSource.
class Autopilot : public input::InputSource
{
public:
    explicit Autopilot(const game::MatchState &match, AutopilotTuning tuning = {});

    // Recompute held keys and ability presses for the coming tick.
    void plan();

    bool is_down(std::initializer_list<std::string_view> keys) const override;
    bool consume(std::string_view key) override;
    void end_frame() override;

private:
    void steer(b2Vec2 dir);

    const game::MatchState &m_match;
    AutopilotTuning m_tuning;
    input::KeyboardState m_keys;
};

} // namespace serpent::headless
