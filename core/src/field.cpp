#include "bsk/field.h"

#include <cmath>

namespace bsk {

float evaluate_field(const Vec2& point, const std::vector<JointInfluence>& influences) {
  float total = 0.0f;
  for (const auto& p : influences) {
    const float dx = point.x - p.position.x;
    const float dy = point.y - p.position.y;
    const float d2 = dx * dx + dy * dy;
    const float r2 = p.radius * p.radius;
    if (d2 < r2) {
      const float t = 1.0f - d2 / r2;
      total += p.weight * t * t * t;
    }
  }
  return total;
}

float iso_radius(const JointInfluence& influence, float iso_threshold) {
  if (influence.weight <= 0.0f || iso_threshold >= influence.weight) return 0.0f;
  if (iso_threshold <= 0.0f) return influence.radius;
  return influence.radius * std::sqrt(1.0f - std::cbrt(iso_threshold / influence.weight));
}

} // namespace bsk
