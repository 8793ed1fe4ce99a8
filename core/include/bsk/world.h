#pragma once

#include "bsk/creature.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace bsk {

using Entity = uint32_t;
static constexpr Entity kInvalidEntity = 0;

struct CreatureContours {
  Entity entity = kInvalidEntity;
  std::vector<Segment> segments;
};

// Independent creatures keyed by entity id. Updates and extraction run
// sequentially in ascending id order; creatures share no mutable state.
class World {
 public:
  Entity create_creature(const CreatureConfig& config, const Vec2& position,
                         const CreatureVariation& variation = {});
  Entity add_creature(Creature creature);
  void destroy_creature(Entity entity);
  Creature* get_creature(Entity entity);
  const Creature* get_creature(Entity entity) const;
  bool set_target(Entity entity, const Vec2& target);

  void update(float dt);
  void apply_config(const CreatureConfig& config);
  std::vector<CreatureContours> extract_all() const;

  size_t creature_count() const { return creatures_.size(); }
  std::vector<Entity> entities() const;

 private:
  Entity next_id_ = 1;
  std::unordered_map<Entity, Creature> creatures_;
};

} // namespace bsk
