#include "bsk/ik.h"

#include <algorithm>

namespace bsk::ik {

Vec2 solve_two_bone(const Vec2& origin, const Vec2& target, float l1, float l2, bool bend_right) {
  const Vec2 to_t = vec2_sub(target, origin);
  const float dist = vec2_length(to_t);
  const float d = std::max(kReachEpsilon, std::min(dist, l1 + l2 - kReachEpsilon));
  const float angle = std::atan2(to_t.y, to_t.x);

  // Law of cosines for the angle at the origin; clamp before acos for rounding.
  const float cos_alpha = (l1 * l1 + d * d - l2 * l2) / (2.0f * l1 * d);
  const float alpha = std::acos(clampf(cos_alpha, -1.0f, 1.0f));
  const float knee_angle = angle + (bend_right ? alpha : -alpha);

  return {origin.x + std::cos(knee_angle) * l1, origin.y + std::sin(knee_angle) * l1};
}

} // namespace bsk::ik
