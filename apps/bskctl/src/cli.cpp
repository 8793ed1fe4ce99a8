#include "bskctl/cli_api.h"

#include "bsk/creature.h"
#include "bsk/ik.h"
#include "bsk/log.h"
#include "bsk/movement_log.h"
#include "bsk/rng.h"

#include <cstdlib>
#include <sstream>

namespace {
bool parse_float(const std::string& text, float& out) {
  char* end = nullptr;
  const float v = std::strtof(text.c_str(), &end);
  if (end == text.c_str()) return false;
  while (*end == ' ' || *end == '\t') ++end;
  if (*end != '\0') return false;
  out = v;
  return true;
}

bool parse_int(const std::string& text, int64_t& out) {
  char* end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') return false;
  out = static_cast<int64_t>(v);
  return true;
}

bool next_value(const std::vector<std::string>& args, size_t& i, std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + args[i];
    return false;
  }
  value = args[++i];
  return true;
}

const char* phase_name(bsk::LegPhase phase) {
  return phase == bsk::LegPhase::Stepping ? "stepping" : "idle";
}
} // namespace

bsk::ResolvedPaths init_cli(const char* argv0, const std::optional<std::filesystem::path>& config_override) {
  bsk::log::set_console(bsk::log::Console::Stderr);
  const bsk::ResolvedPaths paths = bsk::resolve_paths(argv0, config_override);
  bsk::log::init("bskctl", paths.root);
  return paths;
}

bool parse_vec2(const std::string& text, bsk::Vec2& out) {
  const auto comma = text.find(',');
  if (comma == std::string::npos) return false;
  bsk::Vec2 v{0.0f, 0.0f};
  if (!parse_float(text.substr(0, comma), v.x)) return false;
  if (!parse_float(text.substr(comma + 1), v.y)) return false;
  out = v;
  return true;
}

bool parse_simulate_args(const std::vector<std::string>& args, SimulateOptions& opts, std::string& error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    std::string value;
    int64_t n = 0;
    if (arg == "--contours") {
      opts.contours = true;
      continue;
    }
    if (!next_value(args, i, value, error)) return false;
    if (arg == "--config") {
      opts.config_path = std::filesystem::path(value);
    } else if (arg == "--out") {
      opts.out_path = std::filesystem::path(value);
    } else if (arg == "--trace") {
      opts.trace_path = std::filesystem::path(value);
    } else if (arg == "--ticks" && parse_int(value, n) && n >= 0) {
      opts.ticks = static_cast<int>(n);
    } else if (arg == "--every" && parse_int(value, n) && n >= 1) {
      opts.every = static_cast<int>(n);
    } else if (arg == "--seed" && parse_int(value, n) && n >= 0) {
      opts.seed = static_cast<uint64_t>(n);
    } else if (arg == "--offspring" && parse_int(value, n) && n >= 0) {
      opts.offspring = static_cast<int>(n);
    } else if (arg == "--dt" && parse_float(value, opts.dt) && opts.dt > 0.0f) {
    } else if (arg == "--start" && parse_vec2(value, opts.start)) {
    } else if (arg == "--target" && parse_vec2(value, opts.target)) {
    } else {
      error = "invalid argument: " + arg + " " + value;
      return false;
    }
  }
  return true;
}

bool parse_ik_args(const std::vector<std::string>& args, IkOptions& opts, std::string& error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    std::string value;
    if (!next_value(args, i, value, error)) return false;
    if (arg == "--l1" && parse_float(value, opts.l1)) {
    } else if (arg == "--l2" && parse_float(value, opts.l2)) {
    } else if (arg == "--origin" && parse_vec2(value, opts.origin)) {
    } else if (arg == "--target" && parse_vec2(value, opts.target)) {
    } else if (arg == "--bend" && (value == "left" || value == "right")) {
      opts.bend_right = value == "right";
    } else {
      error = "invalid argument: " + arg + " " + value;
      return false;
    }
  }
  if (!(opts.l1 > 0.0f) || !(opts.l2 > 0.0f)) {
    error = "bone lengths must be > 0";
    return false;
  }
  return true;
}

void populate_world(bsk::World& world, const bsk::CreatureConfig& config, const SimulateOptions& opts) {
  const bsk::Entity root = world.create_creature(config, opts.start);
  world.set_target(root, opts.target);
  bsk::Rng rng(opts.seed);
  for (int i = 0; i < opts.offspring; ++i) {
    const bsk::Creature* parent = world.get_creature(root);
    if (!parent) break;
    bsk::Creature child = bsk::spawn_offspring(*parent, rng);
    child.set_target(opts.target);
    world.add_creature(std::move(child));
  }
}

void write_segments_json(bsk::json::Writer& w, const std::vector<bsk::Segment>& segments) {
  w.begin_array();
  for (const auto& s : segments) {
    w.begin_array();
    w.point(s.p0);
    w.point(s.p1);
    w.end_array();
  }
  w.end_array();
}

void write_creature_json(bsk::json::Writer& w, bsk::Entity entity, const bsk::Creature& creature,
                         const std::vector<bsk::Segment>* segments) {
  const bsk::Skeleton& skel = creature.skeleton();
  w.begin_object();
  w.field("entity", static_cast<uint64_t>(entity));
  w.field("size", creature.variation().size_multiplier);
  w.field("speed", creature.variation().speed_multiplier);
  w.field("core", skel.core_position);
  w.field("velocity", skel.core_velocity);
  w.key("legs");
  w.begin_array();
  for (const auto& leg : skel.legs) {
    w.begin_object();
    w.field("id", leg.id);
    w.field("hip", bsk::hip_position(skel, leg));
    w.field("knee", leg.knee);
    w.field("foot", leg.foot);
    w.field("phase", phase_name(leg.phase()));
    w.field("progress", leg.step_progress());
    if (leg.swing) {
      w.field("step_target", leg.swing->target);
    }
    w.end_object();
  }
  w.end_array();
  if (segments) {
    w.key("segments");
    write_segments_json(w, *segments);
  }
  w.end_object();
}

int run_simulate(const SimulateOptions& opts, const bsk::CreatureConfig& config, std::ostream& out) {
  bsk::World world;
  populate_world(world, config, opts);
  if (opts.trace_path) {
    bsk::movement_log::open(*opts.trace_path);
  }

  bsk::json::Writer w(out);
  w.begin_object();
  w.field("ticks", static_cast<int64_t>(opts.ticks));
  w.key("frames");
  w.begin_array();
  int64_t steps_started = 0;
  for (int tick = 0; tick <= opts.ticks; ++tick) {
    if (tick > 0) {
      for (bsk::Entity id : world.entities()) {
        if (world.get_creature(id)->update(opts.dt).started) ++steps_started;
      }
    }
    if (tick % opts.every != 0 && tick != opts.ticks) continue;
    w.begin_object();
    w.field("tick", static_cast<int64_t>(tick));
    w.key("creatures");
    w.begin_array();
    for (bsk::Entity id : world.entities()) {
      const bsk::Creature& creature = *world.get_creature(id);
      if (opts.contours) {
        const std::vector<bsk::Segment> segments = creature.extract_contours();
        write_creature_json(w, id, creature, &segments);
      } else {
        write_creature_json(w, id, creature, nullptr);
      }
    }
    w.end_array();
    w.end_object();
  }
  w.end_array();
  w.field("steps_started", steps_started);
  w.end_object();
  w.finish();

  if (opts.trace_path) {
    bsk::movement_log::close();
  }
  bsk::log::info("simulate: " + std::to_string(opts.ticks) + " ticks, " + std::to_string(steps_started) +
                 " steps");
  return 0;
}

int run_contours(const SimulateOptions& opts, const bsk::CreatureConfig& config, std::ostream& out) {
  bsk::World world;
  populate_world(world, config, opts);
  for (int tick = 0; tick < opts.ticks; ++tick) {
    world.update(opts.dt);
  }
  const auto all = world.extract_all();

  bsk::json::Writer w(out);
  w.begin_object();
  w.field("iso_threshold", config.skin.iso_threshold);
  w.field("cell_size", config.skin.cell_size);
  w.key("creatures");
  w.begin_array();
  size_t total = 0;
  for (const auto& contours : all) {
    w.begin_object();
    w.field("entity", static_cast<uint64_t>(contours.entity));
    w.key("segments");
    write_segments_json(w, contours.segments);
    w.end_object();
    total += contours.segments.size();
  }
  w.end_array();
  w.end_object();
  w.finish();
  bsk::log::info("contours: " + std::to_string(total) + " segments");
  return 0;
}

int run_ik(const IkOptions& opts, std::ostream& out) {
  const bsk::Vec2 knee = bsk::ik::solve_two_bone(opts.origin, opts.target, opts.l1, opts.l2, opts.bend_right);
  bsk::json::Writer w(out);
  w.begin_object();
  w.field("knee", knee);
  w.field("upper", bsk::vec2_distance(opts.origin, knee));
  w.field("lower", bsk::vec2_distance(knee, opts.target));
  w.end_object();
  w.finish();
  return 0;
}

int run_validate(const bsk::CreatureConfig& config, const std::vector<std::string>& load_errors, std::ostream& out) {
  std::vector<std::string> errors = load_errors;
  bsk::validate_creature_config(config, errors);
  bsk::json::Writer w(out);
  w.begin_object();
  w.field("ok", errors.empty());
  w.field("legs", static_cast<uint64_t>(config.legs.size()));
  w.key("errors");
  w.begin_array();
  for (const auto& e : errors) {
    w.value(e);
  }
  w.end_array();
  w.end_object();
  w.finish();
  return errors.empty() ? 0 : 1;
}
