#include "bsk/gait.h"

#include "bsk/movement_log.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace bsk::gait {

namespace {
void log_step(const char* what, uint64_t tick, const Leg& leg, const StepEvent& ev) {
  if (!movement_log::enabled()) return;
  std::ostringstream line;
  line.setf(std::ios::fixed);
  line.precision(3);
  line << "step " << what
       << " tick=" << tick
       << " leg=" << leg.id
       << " idx=" << ev.leg_index
       << " start=(" << ev.start.x << "," << ev.start.y << ")"
       << " target=(" << ev.target.x << "," << ev.target.y << ")";
  movement_log::write(line.str());
}
} // namespace

Vec2 ideal_foot_position(const Skeleton& skeleton, const Leg& leg, const GaitParams& params) {
  const Vec2 hip = hip_position(skeleton, leg);
  return vec2_add(vec2_add(hip, vec2_mul(leg.hip_offset, params.ideal_offset_scale)),
                  vec2_mul(skeleton.core_velocity, params.step_lead));
}

bool start_step(Leg& leg, const Vec2& target) {
  if (leg.swing) return false;
  StepSwing swing;
  swing.start = leg.foot;
  swing.target = target;
  leg.swing = swing;
  return true;
}

StepStatus advance_step(Leg& leg, const GaitParams& params) {
  if (!leg.swing) return StepStatus::Idle;
  StepSwing& swing = *leg.swing;
  const int duration = std::max(1, params.step_duration_ticks);

  ++swing.ticks;
  if (swing.ticks >= duration) {
    swing.progress = 1.0f;
    leg.foot = swing.target;
    leg.swing.reset();
    return StepStatus::Completed;
  }

  // Progress is derived from the tick count so it lands on exactly 1; max()
  // keeps it monotonic if the duration is raised mid-swing.
  swing.progress = std::max(swing.progress, static_cast<float>(swing.ticks) / static_cast<float>(duration));
  const float t = (1.0f - std::cos(kPi * swing.progress)) * 0.5f;
  const float arc = std::sin(kPi * swing.progress) * params.step_height;
  leg.foot = vec2_lerp(swing.start, swing.target, t);
  leg.foot.y -= arc;
  return StepStatus::InFlight;
}

GaitScheduler::GaitScheduler(size_t leg_count, const GaitParams& params)
    : sequence_(resolve_gait_sequence(params, leg_count)) {}

void GaitScheduler::set_sequence(std::vector<int> sequence) {
  sequence_ = std::move(sequence);
  if (sequence_.empty() || cursor_ >= sequence_.size()) {
    cursor_ = 0;
  }
}

int GaitScheduler::next_leg() const {
  if (sequence_.empty()) return -1;
  return sequence_[cursor_];
}

std::optional<size_t> GaitScheduler::try_trigger(Skeleton& skeleton, const GaitParams& params) {
  if (sequence_.empty() || stepping_leg_count(skeleton) > 0) {
    return std::nullopt;
  }
  const int idx = sequence_[cursor_];
  if (idx < 0 || static_cast<size_t>(idx) >= skeleton.legs.size()) {
    return std::nullopt;
  }
  Leg& leg = skeleton.legs[static_cast<size_t>(idx)];
  const Vec2 ideal = ideal_foot_position(skeleton, leg, params);
  if (vec2_distance(leg.foot, ideal) <= params.step_trigger_distance) {
    return std::nullopt;
  }
  start_step(leg, ideal);
  cursor_ = (cursor_ + 1) % sequence_.size();
  return static_cast<size_t>(idx);
}

TickResult GaitScheduler::tick(Skeleton& skeleton, const GaitParams& params) {
  TickResult result;
  ++tick_count_;

  if (const auto started = try_trigger(skeleton, params)) {
    const Leg& leg = skeleton.legs[*started];
    StepEvent ev{*started, leg.swing->start, leg.swing->target};
    log_step("start", tick_count_, leg, ev);
    result.started = ev;
  }

  for (size_t i = 0; i < skeleton.legs.size(); ++i) {
    Leg& leg = skeleton.legs[i];
    if (!leg.swing) continue;
    const StepEvent ev{i, leg.swing->start, leg.swing->target};
    if (advance_step(leg, params) == StepStatus::Completed) {
      log_step("land", tick_count_, leg, ev);
      result.completed.push_back(ev);
    }
  }
  return result;
}

} // namespace bsk::gait
