// SPDX-License-Identifier: Apache-2.0
#include "game/physics.hpp"

#include <algorithm>

namespace serpent::phys {

Separation separation(b2Vec2 from, b2Vec2 to)
{
    b2Vec2 d = b2Sub(to, from);
    float len = b2Length(d);
    float div = len > 0.f ? len : 1.f;
    return {{d.x / div, d.y / div}, len};
}

b2Vec2 normalize_or_zero(b2Vec2 v)
{
    float len = b2Length(v);
    if (len <= 0.f)
        len = 1.f;
    return {v.x / len, v.y / len};
}

bool circles_overlap(b2Vec2 a, float ra, b2Vec2 b, float rb)
{
    return b2Distance(a, b) < ra + rb;
}

b2Vec2 wrap_position(b2Vec2 p, const Bounds &bounds)
{
    if (p.x < 0.f)
        p.x += bounds.width;
    if (p.x > bounds.width)
        p.x -= bounds.width;
    if (p.y < 0.f)
        p.y += bounds.height;
    if (p.y > bounds.height)
        p.y -= bounds.height;
    return p;
}

b2Vec2 clamp_position(b2Vec2 p, float radius, const Bounds &bounds)
{
    p.x = std::clamp(p.x, radius, bounds.width - radius);
    p.y = std::clamp(p.y, radius, bounds.height - radius);
    return p;
}

bool outside_bounds(b2Vec2 p, const Bounds &bounds, float margin)
{
    return p.x < -margin || p.y < -margin || p.x > bounds.width + margin || p.y > bounds.height + margin;
}

b2Vec2 integrate(b2Vec2 p, b2Vec2 v, float dt)
{
    return b2MulAdd(p, dt, v);
}

b2Vec2 from_angle(float radians)
{
    return {std::cos(radians), std::sin(radians)};
}

} // namespace serpent::phys
