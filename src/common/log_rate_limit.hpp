// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite rate-limited logging. Emits every Nth invocation at the given level.
// Usage: SERPENT_LOG_EVERY_N(trace, 120, "[tick] enemies={}", n);
// The tick loop runs at 60Hz; per-frame diagnostics go through this macro.
#define SERPENT_LOG_EVERY_N(level, N, ...) \
    do { \
        static uint64_t serpent_log_counter_ = 0; \
        if ((++serpent_log_counter_ % (N)) == 0) { \
            serpent::log::level(__VA_ARGS__); \
        } \
    } while (0)
