// SPDX-License-Identifier: Apache-2.0
// hud.hpp - Display strings derived from the match state after each tick
#pragma once
#include "game/match.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace serpent::game {

struct HudValues
{
    int64_t score{0};
    uint32_t level{1};
    int64_t health{0}; // floored, never negative
    int64_t shield{0};
    std::string combo; // "x1.00"
    std::vector<std::string> missions;
};

std::string format_combo(float combo);
HudValues build_hud(const MatchState &m);

} // namespace serpent::game
