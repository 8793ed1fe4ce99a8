#pragma once

#include "bsk/math.h"

#include <filesystem>
#include <string>
#include <vector>

namespace bsk {

struct IkParams {
  float l1 = 58.0f;
  float l2 = 35.0f;
};

struct GaitParams {
  float step_trigger_distance = 60.0f;
  int step_duration_ticks = 20;
  float step_height = 25.0f;
  float step_lead = 1.5f;
  // Ideal foot sits at hip + hip_offset * ideal_offset_scale (+ lead).
  float ideal_offset_scale = 1.5f;
  // Leg indices in stepping order. Empty selects the default order.
  std::vector<int> sequence;
};

struct JointSkin {
  float radius = 1.0f;
  float weight = 1.0f;
};

struct SkinParams {
  JointSkin core{80.0f, 1.2f};
  JointSkin hip{40.0f, 0.8f};
  JointSkin knee{60.0f, 0.6f};
  JointSkin foot{50.0f, 0.44f};
  float hip_radius_scale = 1.1f;
  // Fraction of foot radius lost at the top of a step arc.
  float foot_step_shrink = 0.25f;
  float iso_threshold = 0.25f;
  float cell_size = 4.0f;
  float padding = 100.0f;
};

struct LocomotionParams {
  float core_lerp = 0.065f;
  float short_hop_distance = 205.0f;
  float snap_distance = 2.2f;
  float wobble_amplitude = 1.5f;
};

struct LegLayout {
  std::string id;
  Vec2 hip_offset{0.0f, 0.0f};
};

struct CreatureConfig {
  IkParams ik;
  GaitParams gait;
  SkinParams skin;
  LocomotionParams locomotion;
  std::vector<LegLayout> legs = default_leg_layout();
  float initial_foot_spread = 2.5f;

  static std::vector<LegLayout> default_leg_layout();
};

// Loads .json or .yaml/.yml. A missing file, an unknown extension or a parse
// failure is logged, appended to errors (when given) and returns defaults.
CreatureConfig load_creature_config(const std::filesystem::path& path,
                                    std::vector<std::string>* errors = nullptr);

// Rejects configurations the per-tick code assumes never happen.
bool validate_creature_config(const CreatureConfig& cfg, std::vector<std::string>& errors);

// Resolved stepping order: the configured sequence, [0,3,1,2] for four legs,
// identity order otherwise.
std::vector<int> resolve_gait_sequence(const GaitParams& gait, size_t leg_count);

} // namespace bsk
