#pragma once

#include "bsk/config.h"
#include "bsk/json_write.h"
#include "bsk/math.h"
#include "bsk/paths.h"
#include "bsk/world.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct SimulateOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> out_path;
  std::optional<std::filesystem::path> trace_path;
  int ticks = 240;
  int every = 10;
  float dt = 1.0f / 60.0f;
  bsk::Vec2 start{0.0f, 0.0f};
  bsk::Vec2 target{300.0f, 0.0f};
  uint64_t seed = 1;
  int offspring = 0;
  bool contours = false;
};

struct IkOptions {
  float l1 = 58.0f;
  float l2 = 35.0f;
  bsk::Vec2 origin{0.0f, 0.0f};
  bsk::Vec2 target{0.0f, 0.0f};
  bool bend_right = true;
};

// Sends log output to stderr, then resolves paths and opens the log file.
// stdout only ever carries command output.
bsk::ResolvedPaths init_cli(const char* argv0, const std::optional<std::filesystem::path>& config_override);

// "x,y" with optional surrounding whitespace.
bool parse_vec2(const std::string& text, bsk::Vec2& out);

bool parse_simulate_args(const std::vector<std::string>& args, SimulateOptions& opts, std::string& error);
bool parse_ik_args(const std::vector<std::string>& args, IkOptions& opts, std::string& error);

// Populates a world with one root creature at start plus any offspring, all
// aimed at target.
void populate_world(bsk::World& world, const bsk::CreatureConfig& config, const SimulateOptions& opts);

void write_creature_json(bsk::json::Writer& w, bsk::Entity entity, const bsk::Creature& creature,
                         const std::vector<bsk::Segment>* segments);
void write_segments_json(bsk::json::Writer& w, const std::vector<bsk::Segment>& segments);

int run_simulate(const SimulateOptions& opts, const bsk::CreatureConfig& config, std::ostream& out);
int run_contours(const SimulateOptions& opts, const bsk::CreatureConfig& config, std::ostream& out);
int run_ik(const IkOptions& opts, std::ostream& out);
int run_validate(const bsk::CreatureConfig& config, const std::vector<std::string>& load_errors, std::ostream& out);
