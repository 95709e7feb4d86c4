// SPDX-License-Identifier: Apache-2.0
#include "game/hud.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace serpent::game {

std::string format_combo(float combo)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "x%.2f", static_cast<double>(combo));
    return buf;
}

HudValues build_hud(const MatchState &m)
{
    HudValues h{};
    h.score = m.score;
    h.level = m.level;
    h.health = static_cast<int64_t>(std::floor(std::max(0.f, m.player.health)));
    h.shield = static_cast<int64_t>(std::floor(m.player.shield));
    h.combo = format_combo(m.combo);
    h.missions.reserve(m.missions.missions().size());
    for (auto &mission : m.missions.missions())
        h.missions.push_back(mission.display_text());
    return h;
}

} // namespace serpent::game
