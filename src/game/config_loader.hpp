// SPDX-License-Identifier: Apache-2.0
// config_loader.hpp - YAML overrides for simulation tunables
#pragma once
#include "game/tuning.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace serpent::game {

// Apply the keys present in `node` (a map) onto `t`; absent keys keep their current value.
// Throws YAML::Exception on type mismatches and std::invalid_argument on out-of-range values.
void apply_tuning_overrides(Tuning &t, const YAML::Node &node);

// Convenience: load a file whose top-level `tuning:` map holds the overrides.
Tuning load_tuning_file(const std::string &path);

// Reject combinations the simulation cannot run with.
void validate_tuning(const Tuning &t);

} // namespace serpent::game
