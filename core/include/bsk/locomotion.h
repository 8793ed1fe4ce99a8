#pragma once

#include "bsk/config.h"
#include "bsk/skeleton.h"

#include <optional>

namespace bsk::locomotion {

struct LocomotionState {
  std::optional<Vec2> last_target;
  float move_start_distance = 0.0f;
  // Driver clock in seconds; drives the idle wobble.
  float time = 0.0f;
  float log_accum = 0.0f;
};

// Moves the core a fraction of the way toward target (plus a small organic
// wobble), snapping onto it at the end of short hops, and sets core_velocity
// to the resulting frame delta.
void step_core_toward(LocomotionState& state,
                      Skeleton& skeleton,
                      const Vec2& target,
                      const LocomotionParams& params,
                      float speed_multiplier,
                      float dt);

// Fraction of the remaining distance covered this tick.
float follow_factor(const LocomotionParams& params, float speed_multiplier, float near_factor);

} // namespace bsk::locomotion
