#pragma once

#include "bsk/math.h"

#include <vector>

namespace bsk {

// One metaball. Rebuilt from the skeleton every draw.
struct JointInfluence {
  Vec2 position{0.0f, 0.0f};
  float radius = 0.0f;
  float weight = 0.0f;
};

// Sum of weight * (1 - d^2/r^2)^3 over influences with d < r. Each term is
// exactly weight at its centre and falls to 0 with zero slope at its radius.
float evaluate_field(const Vec2& point, const std::vector<JointInfluence>& influences);

// Distance from an influence centre at which its field alone equals iso:
// radius * sqrt(1 - (iso / weight)^(1/3)). Zero when iso >= weight.
float iso_radius(const JointInfluence& influence, float iso_threshold);

} // namespace bsk
