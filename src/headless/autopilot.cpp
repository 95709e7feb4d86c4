// SPDX-License-Identifier: Apache-2.0
#include "headless/autopilot.hpp"

#include "game/physics.hpp"
#include "game/progression.hpp"

#include <limits>

namespace serpent::headless {

Autopilot::Autopilot(const game::MatchState &match, AutopilotTuning tuning)
    : m_match(match)
    , m_tuning(tuning)
{
}

void Autopilot::steer(b2Vec2 dir)
{
    using namespace input;
    if (dir.x > m_tuning.key_threshold)
        m_keys.press(key::right);
    else if (dir.x < -m_tuning.key_threshold)
        m_keys.press(key::left);
    if (dir.y > m_tuning.key_threshold)
        m_keys.press(key::down);
    else if (dir.y < -m_tuning.key_threshold)
        m_keys.press(key::up);
}

void Autopilot::plan()
{
    using namespace input;
    m_keys.release_all();
    const game::Player &p = m_match.player;

    const game::Enemy *nearest = nullptr;
    float nearest_d = std::numeric_limits<float>::max();
    uint32_t close = 0;
    bool target_ahead = false;
    for (auto &e : m_match.enemies) {
        if (!e.alive)
            continue;
        phys::Separation sep = phys::separation(p.head, e.pos);
        if (sep.distance < nearest_d) {
            nearest_d = sep.distance;
            nearest = &e;
        }
        if (sep.distance < m_tuning.mine_distance)
            ++close;
        if (sep.distance < m_tuning.fire_range && b2Dot(p.dir, sep.dir) > m_tuning.fire_cone)
            target_ahead = true;
    }

    if (nearest && nearest_d < m_tuning.evade_distance) {
        steer(b2Neg(phys::separation(p.head, nearest->pos).dir));
    } else {
        const game::Pickup *goal = nullptr;
        float goal_d = std::numeric_limits<float>::max();
        for (auto &c : m_match.pickups) {
            float d = b2Distance(p.head, c.pos);
            if (d < goal_d) {
                goal_d = d;
                goal = &c;
            }
        }
        if (goal)
            steer(phys::separation(p.head, goal->pos).dir);
        else if (nearest)
            steer(phys::separation(p.head, nearest->pos).dir);
    }

    if (target_ahead)
        m_keys.press(key::fire);
    if (close >= m_tuning.mine_min_enemies)
        m_keys.press(key::mine);
    if (nearest && nearest_d < m_tuning.dash_distance)
        m_keys.press(key::dash);
    if (game::boss_alive(m_match))
        m_keys.press(key::burst);
}

bool Autopilot::is_down(std::initializer_list<std::string_view> keys) const
{
    return m_keys.is_down(keys);
}

bool Autopilot::consume(std::string_view key)
{
    return m_keys.consume(key);
}

void Autopilot::end_frame()
{
    m_keys.end_frame();
}

} // namespace serpent::headless
