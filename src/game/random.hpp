// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <random>

namespace serpent::game {

using Rng = std::mt19937;

// Uniform in [lo, hi).
inline float rand_range(Rng &rng, float lo, float hi)
{
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(rng);
}

// Uniform integer in [lo, hi] (inclusive).
inline int rand_int(Rng &rng, int lo, int hi)
{
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

inline float rand_unit(Rng &rng)
{
    return rand_range(rng, 0.f, 1.f);
}

} // namespace serpent::game
