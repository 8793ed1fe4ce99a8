#include "bsk/creature.h"

#include "bsk/log.h"

namespace bsk {

namespace {
constexpr float kOffspringScatter = 100.0f;

bool same_layout(const std::vector<LegLayout>& a, const std::vector<LegLayout>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].id != b[i].id || a[i].hip_offset.x != b[i].hip_offset.x ||
        a[i].hip_offset.y != b[i].hip_offset.y) {
      return false;
    }
  }
  return true;
}
} // namespace

CreatureVariation mutate_variation(const CreatureVariation& parent, Rng& rng) {
  CreatureVariation child;
  child.size_multiplier = parent.size_multiplier * rng.uniform(0.95f, 1.05f);
  child.speed_multiplier = parent.speed_multiplier * rng.uniform(0.95f, 1.05f);
  return child;
}

Creature::Creature(const CreatureConfig& config, const Vec2& core_position, const CreatureVariation& variation)
    : config_(config),
      variation_(variation),
      skeleton_(create_skeleton(config, core_position)),
      gait_(config.legs.size(), config.gait),
      target_(core_position) {}

gait::TickResult Creature::update(float dt) {
  locomotion::step_core_toward(locomotion_, skeleton_, target_, config_.locomotion,
                               variation_.speed_multiplier, dt);
  gait::TickResult result = gait_.tick(skeleton_, config_.gait);
  solve_knees(skeleton_, config_.ik);
  return result;
}

void Creature::apply_config(const CreatureConfig& config) {
  const std::vector<LegLayout> layout = config_.legs;
  const float spread = config_.initial_foot_spread;
  config_ = config;
  if (!same_layout(layout, config.legs)) {
    log::warn("leg layout is fixed at creation; ignoring layout change");
    config_.legs = layout;
    config_.initial_foot_spread = spread;
  }
  gait_.set_sequence(resolve_gait_sequence(config_.gait, skeleton_.legs.size()));
  solve_knees(skeleton_, config_.ik);
}

void Creature::collect_influences(std::vector<JointInfluence>& out) const {
  const SkinParams& skin = config_.skin;
  const float size = variation_.size_multiplier;
  out.clear();
  out.reserve(1 + skeleton_.legs.size() * 3);
  out.push_back({skeleton_.core_position, skin.core.radius * size, skin.core.weight});
  for (const auto& leg : skeleton_.legs) {
    out.push_back({hip_position(skeleton_, leg), skin.hip.radius * size * skin.hip_radius_scale, skin.hip.weight});
    out.push_back({leg.knee, skin.knee.radius * size, skin.knee.weight});
    float foot_radius = skin.foot.radius * size;
    if (leg.is_stepping()) {
      foot_radius *= 1.0f - std::sin(leg.step_progress() * kPi) * skin.foot_step_shrink;
    }
    out.push_back({leg.foot, foot_radius, skin.foot.weight});
  }
}

std::vector<JointInfluence> Creature::collect_influences() const {
  std::vector<JointInfluence> out;
  collect_influences(out);
  return out;
}

void Creature::extract_contours(SamplingGrid& grid, std::vector<Segment>& out) const {
  const std::vector<JointInfluence> influences = collect_influences();
  out.clear();
  build_sampling_grid(influences, config_.skin.cell_size, config_.skin.padding, grid);
  bsk::extract_contours(grid, config_.skin.iso_threshold, out);
}

std::vector<Segment> Creature::extract_contours() const {
  SamplingGrid grid;
  std::vector<Segment> out;
  extract_contours(grid, out);
  return out;
}

Creature spawn_offspring(const Creature& parent, Rng& rng) {
  const Vec2 core = parent.skeleton().core_position;
  const Vec2 pos{core.x + rng.uniform(-kOffspringScatter, kOffspringScatter),
                 core.y + rng.uniform(-kOffspringScatter, kOffspringScatter)};
  return Creature(parent.config(), pos, mutate_variation(parent.variation(), rng));
}

} // namespace bsk
