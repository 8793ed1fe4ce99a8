#pragma once

#include "bsk/math.h"

namespace bsk::ik {

// Reach is clamped to [kReachEpsilon, l1 + l2 - kReachEpsilon].
constexpr float kReachEpsilon = 0.1f;

// Analytic two-bone solve in the plane. Returns the knee position for a chain
// rooted at origin whose end effector aims at target. Unreachable targets are
// solved for the clamped reach along the same direction. l1 and l2 must be > 0
// (validated with the config, not here).
Vec2 solve_two_bone(const Vec2& origin, const Vec2& target, float l1, float l2, bool bend_right);

} // namespace bsk::ik
