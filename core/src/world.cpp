#include "bsk/world.h"

#include <algorithm>
#include <utility>

namespace bsk {

Entity World::create_creature(const CreatureConfig& config, const Vec2& position,
                              const CreatureVariation& variation) {
  return add_creature(Creature(config, position, variation));
}

Entity World::add_creature(Creature creature) {
  const Entity id = next_id_++;
  creatures_.emplace(id, std::move(creature));
  return id;
}

void World::destroy_creature(Entity entity) {
  creatures_.erase(entity);
}

Creature* World::get_creature(Entity entity) {
  auto it = creatures_.find(entity);
  if (it == creatures_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Creature* World::get_creature(Entity entity) const {
  auto it = creatures_.find(entity);
  if (it == creatures_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool World::set_target(Entity entity, const Vec2& target) {
  Creature* creature = get_creature(entity);
  if (!creature) return false;
  creature->set_target(target);
  return true;
}

void World::update(float dt) {
  for (Entity id : entities()) {
    creatures_.at(id).update(dt);
  }
}

void World::apply_config(const CreatureConfig& config) {
  for (auto& kv : creatures_) {
    kv.second.apply_config(config);
  }
}

std::vector<CreatureContours> World::extract_all() const {
  std::vector<CreatureContours> out;
  out.reserve(creatures_.size());
  SamplingGrid grid;
  for (Entity id : entities()) {
    CreatureContours contours;
    contours.entity = id;
    creatures_.at(id).extract_contours(grid, contours.segments);
    out.push_back(std::move(contours));
  }
  return out;
}

std::vector<Entity> World::entities() const {
  std::vector<Entity> ids;
  ids.reserve(creatures_.size());
  for (const auto& kv : creatures_) {
    ids.push_back(kv.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace bsk
