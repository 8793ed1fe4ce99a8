#include "bsk/locomotion.h"

#include "bsk/movement_log.h"

#include <cmath>
#include <sstream>

namespace bsk::locomotion {

namespace {
constexpr float kNearRange = 250.0f;
constexpr float kWobbleStart = 6.0f;
constexpr float kWobbleRange = 220.0f;
constexpr float kMinFollow = 0.002f;
constexpr float kMaxFollow = 0.28f;
constexpr float kTargetEps = 0.001f;
constexpr float kLogInterval = 0.1f;

bool target_changed(const LocomotionState& state, const Vec2& target) {
  if (!state.last_target) return true;
  return std::fabs(target.x - state.last_target->x) > kTargetEps ||
         std::fabs(target.y - state.last_target->y) > kTargetEps;
}

Vec2 wobble_offset(float time, float scale) {
  return {(std::sin(time * 0.7f) * 6.0f + std::cos(time * 1.3f) * 3.0f) * scale,
          (std::cos(time * 0.8f) * 6.0f + std::sin(time * 1.1f) * 3.0f) * scale};
}
} // namespace

float follow_factor(const LocomotionParams& params, float speed_multiplier, float near_factor) {
  const float close_boost = lerpf(1.2f, 7.2f, near_factor);
  const float close_assist = near_factor * 0.02f * speed_multiplier;
  return clampf(params.core_lerp * speed_multiplier * close_boost + close_assist, kMinFollow, kMaxFollow);
}

void step_core_toward(LocomotionState& state,
                      Skeleton& skeleton,
                      const Vec2& target,
                      const LocomotionParams& params,
                      float speed_multiplier,
                      float dt) {
  state.time += dt;
  Vec2& core = skeleton.core_position;
  const Vec2 prev = core;

  const float dist = vec2_distance(core, target);
  if (target_changed(state, target)) {
    state.move_start_distance = dist;
    state.last_target = target;
  }

  const bool short_hop = state.move_start_distance <= params.short_hop_distance;
  const float near_factor = short_hop ? clampf(1.0f - dist / kNearRange, 0.0f, 1.0f) : 0.0f;
  const float wobble_scale = clampf((dist - kWobbleStart) / kWobbleRange, 0.0f, 1.0f) * params.wobble_amplitude;
  const Vec2 desired = vec2_add(target, wobble_offset(state.time, wobble_scale));

  const float follow = follow_factor(params, speed_multiplier, near_factor);
  core = vec2_lerp(core, desired, follow);

  if (short_hop && vec2_distance(core, target) < params.snap_distance) {
    core = target;
  }

  skeleton.core_velocity = vec2_sub(core, prev);

  if (movement_log::enabled()) {
    state.log_accum += dt;
    if (state.log_accum >= kLogInterval) {
      state.log_accum = 0.0f;
      std::ostringstream line;
      line.setf(std::ios::fixed);
      line.precision(3);
      line << "core t=" << state.time
           << " pos=(" << core.x << "," << core.y << ")"
           << " vel=(" << skeleton.core_velocity.x << "," << skeleton.core_velocity.y << ")"
           << " target=(" << target.x << "," << target.y << ")"
           << " follow=" << follow;
      movement_log::write(line.str());
    }
  }
}

} // namespace bsk::locomotion
