// SPDX-License-Identifier: Apache-2.0
#include "game/missions.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace serpent::game {

namespace {

constexpr int64_t k_mission_reward = 180;

Mission make_mission(const char *id, const char *text, float target, MissionKind kind, std::optional<float> timer = {})
{
    Mission m{};
    m.id = id;
    m.text = text;
    m.target = target;
    m.kind = kind;
    m.timer = timer;
    m.timer_start = timer.value_or(0.f);
    m.reward = k_mission_reward;
    return m;
}

void complete(Mission &m)
{
    m.progress = m.target;
    m.done = true;
    serpent::log::info("[mission] done id={} reward={}", m.id, m.reward);
}

} // namespace

const char *mission_kind_name(MissionKind kind)
{
    switch (kind) {
        case MissionKind::runner_kills:
            return "runner_kills";
        case MissionKind::pickup_collect:
            return "pickup_collect";
        case MissionKind::seconds_no_hit:
            return "seconds_no_hit";
        case MissionKind::mine_kills:
            return "mine_kills";
        case MissionKind::combo_peak:
            return "combo_peak";
    }
    return "unknown";
}

void Mission::increment(float amount)
{
    if (terminal())
        return;
    progress = std::min(target, progress + amount);
    if (progress >= target)
        complete(*this);
}

std::string Mission::display_text() const
{
    if (failed)
        return text + " [FAILED]";
    if (done)
        return text + " [DONE]";
    std::ostringstream os;
    os << text << ": " << static_cast<int64_t>(std::floor(progress)) << '/' << static_cast<int64_t>(target);
    if (timer)
        os << " (" << static_cast<int64_t>(std::ceil(std::max(0.f, *timer))) << "s)";
    return os.str();
}

uint32_t missions_for_level(uint32_t level)
{
    return level % 3 == 0 ? 3 : 2;
}

std::vector<Mission> MissionTracker::templates()
{
    return {
        make_mission("kill_runners", "Eliminate runner units", 6.f, MissionKind::runner_kills),
        make_mission("collect_cores", "Absorb unstable cores", 8.f, MissionKind::pickup_collect),
        make_mission("no_hit", "No damage for 30s", 30.f, MissionKind::seconds_no_hit, 30.f),
        make_mission("mine_kill", "Destroy enemies with mines", 5.f, MissionKind::mine_kills),
        make_mission("combo", "Reach combo x5", 5.f, MissionKind::combo_peak),
    };
}

void MissionTracker::start_level(uint32_t level, Rng &rng)
{
    auto bag = templates();
    std::shuffle(bag.begin(), bag.end(), rng);
    bag.resize(std::min<size_t>(bag.size(), missions_for_level(level)));
    m_missions = std::move(bag);
    for (auto &m : m_missions)
        serpent::log::debug("[mission] level={} drawn id={} kind={}", level, m.id, mission_kind_name(m.kind));
}

void MissionTracker::update(float dt, bool took_damage_this_level, uint32_t combo_tier)
{
    for (auto &m : m_missions) {
        if (m.terminal())
            continue;
        if (m.timer)
            *m.timer -= dt;
        if (m.kind == MissionKind::seconds_no_hit && !took_damage_this_level)
            m.progress = std::clamp(m.timer_start - m.timer.value_or(0.f), 0.f, m.target);
        else if (m.kind == MissionKind::combo_peak)
            m.progress = std::max(m.progress, std::min(m.target, static_cast<float>(combo_tier)));
        // Progress is settled before the timer verdict, so reaching the target on the final tick still counts.
        if (m.progress >= m.target) {
            complete(m);
        } else if (m.timer && *m.timer <= 0.f) {
            m.failed = true;
            serpent::log::info("[mission] failed id={} progress={}/{}", m.id, m.progress, m.target);
        }
    }
}

void MissionTracker::on_event(MissionKind kind, float amount)
{
    for (auto &m : m_missions) {
        if (m.kind == kind)
            m.increment(amount);
    }
}

int64_t MissionTracker::reward_total() const
{
    int64_t sum = 0;
    for (auto &m : m_missions) {
        if (m.done)
            sum += m.reward;
    }
    return sum;
}

} // namespace serpent::game
