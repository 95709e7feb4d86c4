// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - Read-only presentation view of the match as a FrameSnapshot protobuf message
#pragma once
#include "game/match.hpp"
#include "serpent.pb.h"

namespace serpent::game {

// Readiness ratio of a cooldown: clamp(1 - remaining / max, 0, 1). A zero max reads as ready.
float cooldown_ratio(float remaining, float max);

// Fill `out` from the state; previous contents are cleared so callers may reuse one message.
void build_frame_snapshot(const MatchState &m, serpent::wire::FrameSnapshot &out);

} // namespace serpent::game
