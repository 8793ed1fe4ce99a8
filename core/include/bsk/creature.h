#pragma once

#include "bsk/config.h"
#include "bsk/field.h"
#include "bsk/gait.h"
#include "bsk/locomotion.h"
#include "bsk/marching_squares.h"
#include "bsk/rng.h"
#include "bsk/skeleton.h"

#include <vector>

namespace bsk {

struct CreatureVariation {
  float size_multiplier = 1.0f;
  float speed_multiplier = 1.0f;
};

// Child multipliers are the parent's scaled by uniform [0.95, 1.05).
CreatureVariation mutate_variation(const CreatureVariation& parent, Rng& rng);

class Creature {
 public:
  Creature(const CreatureConfig& config, const Vec2& core_position, const CreatureVariation& variation = {});

  void set_target(const Vec2& target) { target_ = target; }
  const Vec2& target() const { return target_; }

  // One tick: core follows the target, the gait may start one swing, swings
  // advance, then every knee is re-solved.
  gait::TickResult update(float dt);

  // Swaps numeric parameters in place. The leg layout is fixed at creation;
  // a config with a different layout only updates the rest.
  void apply_config(const CreatureConfig& config);

  void collect_influences(std::vector<JointInfluence>& out) const;
  std::vector<JointInfluence> collect_influences() const;

  // Contours of the current pose at the configured cell size, iso and padding.
  // Replaces the contents of out; grid is rebuilt in place.
  void extract_contours(SamplingGrid& grid, std::vector<Segment>& out) const;
  std::vector<Segment> extract_contours() const;

  const Skeleton& skeleton() const { return skeleton_; }
  Skeleton& skeleton() { return skeleton_; }
  const CreatureConfig& config() const { return config_; }
  const CreatureVariation& variation() const { return variation_; }
  const gait::GaitScheduler& scheduler() const { return gait_; }

 private:
  CreatureConfig config_;
  CreatureVariation variation_;
  Skeleton skeleton_;
  gait::GaitScheduler gait_;
  locomotion::LocomotionState locomotion_;
  Vec2 target_;
};

// Offspring spawn within +-100 of the parent core with mutated variation.
Creature spawn_offspring(const Creature& parent, Rng& rng);

} // namespace bsk
