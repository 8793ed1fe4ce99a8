#pragma once

#include "bsk/config.h"
#include "bsk/math.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bsk {

// An in-flight swing. A leg carries one only while it is stepping, so an idle
// leg never holds a stale start/target pair.
struct StepSwing {
  Vec2 start{0.0f, 0.0f};
  Vec2 target{0.0f, 0.0f};
  int ticks = 0;
  float progress = 0.0f;
};

enum class LegPhase : uint8_t {
  Idle = 0,
  Stepping = 1
};

struct Leg {
  std::string id;
  // Fixed at creation; hips move only with the core.
  Vec2 hip_offset{0.0f, 0.0f};
  Vec2 foot{0.0f, 0.0f};
  Vec2 knee{0.0f, 0.0f};
  std::optional<StepSwing> swing;

  LegPhase phase() const { return swing ? LegPhase::Stepping : LegPhase::Idle; }
  bool is_stepping() const { return swing.has_value(); }
  // 1 when idle (the last swing, if any, finished).
  float step_progress() const { return swing ? swing->progress : 1.0f; }
  // Knees bend away from the body's vertical midline.
  bool bends_right() const { return hip_offset.x > 0.0f; }
};

struct Skeleton {
  Vec2 core_position{0.0f, 0.0f};
  Vec2 core_velocity{0.0f, 0.0f};
  // Order is the gait's index space; never reordered after creation.
  std::vector<Leg> legs;
};

// Builds legs from the layout with feet spread at hip_offset * spread and knees
// already solved.
Skeleton create_skeleton(const CreatureConfig& cfg, const Vec2& core_position);

Vec2 hip_position(const Skeleton& skeleton, const Leg& leg);
const Leg* find_leg(const Skeleton& skeleton, std::string_view id);
Leg* find_leg(Skeleton& skeleton, std::string_view id);
size_t stepping_leg_count(const Skeleton& skeleton);

// Recomputes every knee from its hip and current foot.
void solve_knees(Skeleton& skeleton, const IkParams& ik);

struct Bounds {
  Vec2 min{0.0f, 0.0f};
  Vec2 max{0.0f, 0.0f};
};

// Extent of core, hips, knees and feet (joint centres only).
Bounds skeleton_bounds(const Skeleton& skeleton);

} // namespace bsk
