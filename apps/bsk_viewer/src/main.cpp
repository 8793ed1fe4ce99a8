#include "bsk/config.h"
#include "bsk/creature.h"
#include "bsk/log.h"
#include "bsk/paths.h"
#include "bsk/rng.h"
#include "bsk/world.h"
#include "bsk_platform/file_watcher.h"
#include "bsk_platform/platform.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr float kFixedStep = 1.0f / 60.0f;
constexpr int kMaxStepsPerFrame = 5;

const bsk::platform::Color kBackground{16, 18, 24, 255};
const bsk::platform::Color kSkinColor{230, 236, 245, 255};
const bsk::platform::Color kBoneColor{255, 140, 60, 255};
const bsk::platform::Color kSwingColor{90, 200, 255, 255};

struct ViewerState {
  bsk::World world;
  bsk::Entity active = bsk::kInvalidEntity;
  bsk::CreatureConfig config;
  fs::path config_path;
  bool show_bones = false;
};

bool reload_config(ViewerState& state) {
  std::vector<std::string> errors;
  bsk::CreatureConfig cfg = bsk::load_creature_config(state.config_path, &errors);
  bsk::validate_creature_config(cfg, errors);
  if (!errors.empty()) {
    for (const auto& e : errors) {
      bsk::log::warn("config rejected: " + e);
    }
    return false;
  }
  state.config = cfg;
  state.world.apply_config(state.config);
  bsk::log::info("config reloaded: " + state.config_path.string());
  return true;
}

void add_cross(std::vector<bsk::Segment>& out, const bsk::Vec2& p, float size) {
  out.push_back({{p.x - size, p.y}, {p.x + size, p.y}});
  out.push_back({{p.x, p.y - size}, {p.x, p.y + size}});
}

void collect_bones(const bsk::Creature& creature, std::vector<bsk::Segment>& bones,
                   std::vector<bsk::Segment>& swings) {
  const bsk::Skeleton& skel = creature.skeleton();
  add_cross(bones, skel.core_position, 4.0f);
  for (const auto& leg : skel.legs) {
    const bsk::Vec2 hip = bsk::hip_position(skel, leg);
    bones.push_back({skel.core_position, hip});
    bones.push_back({hip, leg.knee});
    bones.push_back({leg.knee, leg.foot});
    if (leg.swing) {
      add_cross(swings, leg.swing->target, 3.0f);
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::optional<fs::path> config_override;
  uint64_t seed = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_override = fs::path(argv[++i]);
    } else if (arg == "--seed" && i + 1 < argc) {
      seed = std::strtoull(argv[++i], nullptr, 10);
    }
  }

  const auto paths = bsk::resolve_paths(argc > 0 ? argv[0] : nullptr, config_override);
  bsk::log::init("bsk_viewer", paths.root);
  bsk::log::install_crash_handlers();

  bsk::platform::Platform platform;
  if (!platform.init({1280, 720, "blobskin"})) {
    bsk::log::error("platform init failed");
    bsk::log::shutdown();
    return 1;
  }

  ViewerState state;
  state.config_path = paths.creature_config;
  std::vector<std::string> errors;
  state.config = bsk::load_creature_config(state.config_path, &errors);
  if (!bsk::validate_creature_config(state.config, errors)) {
    for (const auto& e : errors) {
      bsk::log::warn("config rejected, using defaults: " + e);
    }
    state.config = bsk::CreatureConfig{};
  }
  const bsk::Vec2 center{platform.width() * 0.5f, platform.height() * 0.5f};
  state.active = state.world.create_creature(state.config, center);

  bsk::platform::FileWatcher watcher;
  const fs::path watch_dir = state.config_path.parent_path();
  if (watcher.start(watch_dir)) {
    bsk::log::info("watching " + watch_dir.string() + " (" + watcher.backend_name() + ")");
  } else {
    bsk::log::warn("config hot reload disabled: cannot watch " + watch_dir.string());
  }

  bsk::Rng rng(seed);
  bsk::SamplingGrid grid;
  std::vector<bsk::Segment> skin;
  std::vector<bsk::Segment> bones;
  std::vector<bsk::Segment> swings;
  std::vector<bsk::platform::FileChange> changes;
  float accumulator = 0.0f;

  while (!platform.should_quit()) {
    platform.poll_events();

    if (platform.was_key_pressed(bsk::platform::KeyCode::F1)) {
      state.show_bones = !state.show_bones;
    }
    if (platform.was_key_pressed(bsk::platform::KeyCode::F5)) {
      reload_config(state);
    }
    if (platform.was_key_pressed(bsk::platform::KeyCode::Space)) {
      if (const bsk::Creature* parent = state.world.get_creature(state.active)) {
        bsk::Creature child = bsk::spawn_offspring(*parent, rng);
        const bsk::Entity id = state.world.add_creature(std::move(child));
        bsk::log::info("spawned offspring " + std::to_string(id));
      }
    }

    changes.clear();
    watcher.poll(changes);
    for (const auto& change : changes) {
      std::error_code ec;
      if (change.type != bsk::platform::FileChange::Type::Removed &&
          fs::equivalent(change.path, state.config_path, ec)) {
        reload_config(state);
        break;
      }
    }

    const bsk::Vec2 mouse = platform.mouse_position();
    for (bsk::Entity id : state.world.entities()) {
      state.world.set_target(id, mouse);
    }

    accumulator += platform.delta_seconds();
    int steps = 0;
    while (accumulator >= kFixedStep && steps < kMaxStepsPerFrame) {
      state.world.update(kFixedStep);
      accumulator -= kFixedStep;
      ++steps;
    }
    if (steps == kMaxStepsPerFrame) {
      accumulator = 0.0f;
    }

    platform.begin_frame(kBackground);
    bones.clear();
    swings.clear();
    for (bsk::Entity id : state.world.entities()) {
      const bsk::Creature* creature = state.world.get_creature(id);
      creature->extract_contours(grid, skin);
      platform.draw_lines(skin, kSkinColor);
      if (state.show_bones) {
        collect_bones(*creature, bones, swings);
      }
    }
    if (state.show_bones) {
      platform.draw_lines(bones, kBoneColor);
      platform.draw_lines(swings, kSwingColor);
    }
    platform.present();
  }

  watcher.stop();
  platform.shutdown();
  bsk::log::shutdown();
  return 0;
}
