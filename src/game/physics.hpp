// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Kinematic helpers for the arcade world (circle overlap, wrap/clamp, integration)
#pragma once
#include <box2d/box2d.h>

#include <cmath>

namespace serpent::phys {

struct Bounds
{
    float width{0.f};
    float height{0.f};
};

struct Separation
{
    b2Vec2 dir; // unit vector from -> to (zero when the points coincide)
    float distance{0.f};
};

// Unit direction and distance between two points. A zero-length separation divides by 1 instead of 0.
Separation separation(b2Vec2 from, b2Vec2 to);
// Normalize with the same unit-divisor fallback.
b2Vec2 normalize_or_zero(b2Vec2 v);
bool circles_overlap(b2Vec2 a, float ra, b2Vec2 b, float rb);
// Player rule: crossing an edge re-enters from the opposite edge.
b2Vec2 wrap_position(b2Vec2 p, const Bounds &bounds);
// Enemy rule: keep the whole circle inside the world.
b2Vec2 clamp_position(b2Vec2 p, float radius, const Bounds &bounds);
bool outside_bounds(b2Vec2 p, const Bounds &bounds, float margin);
b2Vec2 integrate(b2Vec2 p, b2Vec2 v, float dt);
b2Vec2 from_angle(float radians);

// Frame-rate independent blend factor for exponential smoothing.
inline float smoothing_factor(float rate, float dt)
{
    return 1.f - std::exp(-rate * dt);
}

} // namespace serpent::phys
