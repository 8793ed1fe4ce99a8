#include "bsk/skeleton.h"

#include "bsk/ik.h"

#include <algorithm>

namespace bsk {

Skeleton create_skeleton(const CreatureConfig& cfg, const Vec2& core_position) {
  Skeleton skeleton;
  skeleton.core_position = core_position;
  skeleton.legs.reserve(cfg.legs.size());
  for (const auto& layout : cfg.legs) {
    Leg leg;
    leg.id = layout.id;
    leg.hip_offset = layout.hip_offset;
    leg.foot = vec2_add(core_position, vec2_mul(layout.hip_offset, cfg.initial_foot_spread));
    leg.knee = leg.foot;
    skeleton.legs.push_back(leg);
  }
  solve_knees(skeleton, cfg.ik);
  return skeleton;
}

Vec2 hip_position(const Skeleton& skeleton, const Leg& leg) {
  return vec2_add(skeleton.core_position, leg.hip_offset);
}

const Leg* find_leg(const Skeleton& skeleton, std::string_view id) {
  for (const auto& leg : skeleton.legs) {
    if (leg.id == id) return &leg;
  }
  return nullptr;
}

Leg* find_leg(Skeleton& skeleton, std::string_view id) {
  for (auto& leg : skeleton.legs) {
    if (leg.id == id) return &leg;
  }
  return nullptr;
}

size_t stepping_leg_count(const Skeleton& skeleton) {
  return static_cast<size_t>(std::count_if(skeleton.legs.begin(), skeleton.legs.end(),
                                           [](const Leg& leg) { return leg.is_stepping(); }));
}

void solve_knees(Skeleton& skeleton, const IkParams& ik) {
  for (auto& leg : skeleton.legs) {
    leg.knee = ik::solve_two_bone(hip_position(skeleton, leg), leg.foot, ik.l1, ik.l2, leg.bends_right());
  }
}

Bounds skeleton_bounds(const Skeleton& skeleton) {
  Bounds b{skeleton.core_position, skeleton.core_position};
  auto grow = [&b](const Vec2& p) {
    b.min.x = std::min(b.min.x, p.x);
    b.min.y = std::min(b.min.y, p.y);
    b.max.x = std::max(b.max.x, p.x);
    b.max.y = std::max(b.max.y, p.y);
  };
  for (const auto& leg : skeleton.legs) {
    grow(hip_position(skeleton, leg));
    grow(leg.knee);
    grow(leg.foot);
  }
  return b;
}

} // namespace bsk
