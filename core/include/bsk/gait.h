#pragma once

#include "bsk/config.h"
#include "bsk/skeleton.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace bsk::gait {

enum class StepStatus : uint8_t {
  Idle = 0,
  InFlight = 1,
  Completed = 2
};

struct StepEvent {
  size_t leg_index = 0;
  Vec2 start{0.0f, 0.0f};
  Vec2 target{0.0f, 0.0f};
};

struct TickResult {
  std::optional<StepEvent> started;
  std::vector<StepEvent> completed;
};

// Where the foot wants to be: hip + hip_offset * ideal_offset_scale, led by
// the core velocity so feet land ahead of the direction of travel.
Vec2 ideal_foot_position(const Skeleton& skeleton, const Leg& leg, const GaitParams& params);

// Begins a swing from the current foot position. No-op if already stepping.
bool start_step(Leg& leg, const Vec2& target);

// Advances one tick of a swing along the eased half-sine arc. On the tick
// the swing finishes the foot snaps onto the target and the leg goes idle.
StepStatus advance_step(Leg& leg, const GaitParams& params);

// Round-robin scheduler. At most one leg swings at a time; a new swing is
// only considered while every leg is planted, and only for the leg at the
// cursor.
class GaitScheduler {
 public:
  GaitScheduler() = default;
  GaitScheduler(size_t leg_count, const GaitParams& params);

  TickResult tick(Skeleton& skeleton, const GaitParams& params);

  // Checks the leg at the cursor and starts its swing when its foot has
  // drifted past the trigger distance. Returns the started leg index.
  std::optional<size_t> try_trigger(Skeleton& skeleton, const GaitParams& params);

  int next_leg() const;
  size_t cursor() const { return cursor_; }
  const std::vector<int>& sequence() const { return sequence_; }
  void set_sequence(std::vector<int> sequence);
  uint64_t tick_count() const { return tick_count_; }

 private:
  std::vector<int> sequence_;
  size_t cursor_ = 0;
  uint64_t tick_count_ = 0;
};

} // namespace bsk::gait
