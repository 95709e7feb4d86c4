// SPDX-License-Identifier: Apache-2.0
// effects.hpp - Side-effect requests produced by one tick for presentation collaborators (audio, particles, HUD
// banners). Purely cosmetic: nothing here feeds back into the simulation.
#pragma once
#include <box2d/box2d.h>

#include <cstdint>
#include <string>
#include <vector>

namespace serpent::game {

enum class AudioCue : uint8_t
{
    hit,
    pickup,
    shoot,
    dash,
    level_up,
    death
};

inline const char *cue_name(AudioCue cue)
{
    switch (cue) {
        case AudioCue::hit:
            return "hit";
        case AudioCue::pickup:
            return "pickup";
        case AudioCue::shoot:
            return "shoot";
        case AudioCue::dash:
            return "dash";
        case AudioCue::level_up:
            return "level_up";
        case AudioCue::death:
            return "death";
    }
    return "unknown";
}

struct ParticleBurst
{
    b2Vec2 pos;
    uint32_t count{0};
    uint32_t color{0}; // 0xRRGGBB
    float speed{160.f};
    float size{3.f};
};

struct ParticleTrail
{
    b2Vec2 pos;
    uint32_t color{0};
};

struct Announcement
{
    std::string text;
    float duration_sec{0.f};
};

struct FrameEffects
{
    std::vector<AudioCue> cues;
    std::vector<ParticleBurst> bursts;
    std::vector<ParticleTrail> trails;
    std::vector<Announcement> announcements;

    void clear()
    {
        cues.clear();
        bursts.clear();
        trails.clear();
        announcements.clear();
    }

    void cue(AudioCue c) { cues.push_back(c); }

    void burst(b2Vec2 pos, uint32_t count, uint32_t color, float speed = 160.f, float size = 3.f)
    {
        bursts.push_back({pos, count, color, speed, size});
    }

    bool has_cue(AudioCue c) const
    {
        for (auto x : cues)
            if (x == c)
                return true;
        return false;
    }
};

} // namespace serpent::game
