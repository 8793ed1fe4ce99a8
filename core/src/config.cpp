#include "bsk/config.h"

#include "bsk/log.h"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <optional>
#include <set>
#include <sstream>

#if BSK_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#if BSK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace bsk {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void report(std::vector<std::string>* errors, const std::string& msg) {
  log::error(msg);
  if (errors) errors->push_back(msg);
}

#if BSK_ENABLE_DATA_JSON
void read_float(const nlohmann::json& node, const char* key, float& out) {
  if (node.contains(key)) out = node[key].get<float>();
}

void read_joint(const nlohmann::json& node, const char* key, JointSkin& out) {
  if (!node.contains(key)) return;
  const auto& joint = node[key];
  read_float(joint, "radius", out.radius);
  read_float(joint, "weight", out.weight);
}

CreatureConfig parse_json(const nlohmann::json& j) {
  CreatureConfig cfg;
  const auto& root = j.contains("creature") ? j["creature"] : j;

  if (root.contains("ik")) {
    const auto& ik = root["ik"];
    read_float(ik, "l1", cfg.ik.l1);
    read_float(ik, "l2", cfg.ik.l2);
  }
  if (root.contains("gait")) {
    const auto& gait = root["gait"];
    read_float(gait, "step_trigger_distance", cfg.gait.step_trigger_distance);
    if (gait.contains("step_duration_ticks")) {
      cfg.gait.step_duration_ticks = gait["step_duration_ticks"].get<int>();
    }
    read_float(gait, "step_height", cfg.gait.step_height);
    read_float(gait, "step_lead", cfg.gait.step_lead);
    read_float(gait, "ideal_offset_scale", cfg.gait.ideal_offset_scale);
    if (gait.contains("sequence") && gait["sequence"].is_array()) {
      cfg.gait.sequence.clear();
      for (const auto& v : gait["sequence"]) {
        cfg.gait.sequence.push_back(v.get<int>());
      }
    }
  }
  if (root.contains("skin")) {
    const auto& skin = root["skin"];
    read_joint(skin, "core", cfg.skin.core);
    read_joint(skin, "hip", cfg.skin.hip);
    read_joint(skin, "knee", cfg.skin.knee);
    read_joint(skin, "foot", cfg.skin.foot);
    read_float(skin, "hip_radius_scale", cfg.skin.hip_radius_scale);
    read_float(skin, "foot_step_shrink", cfg.skin.foot_step_shrink);
    read_float(skin, "iso_threshold", cfg.skin.iso_threshold);
    read_float(skin, "cell_size", cfg.skin.cell_size);
    read_float(skin, "padding", cfg.skin.padding);
  }
  if (root.contains("locomotion")) {
    const auto& loco = root["locomotion"];
    read_float(loco, "core_lerp", cfg.locomotion.core_lerp);
    read_float(loco, "short_hop_distance", cfg.locomotion.short_hop_distance);
    read_float(loco, "snap_distance", cfg.locomotion.snap_distance);
    read_float(loco, "wobble_amplitude", cfg.locomotion.wobble_amplitude);
  }
  if (root.contains("legs") && root["legs"].is_array()) {
    cfg.legs.clear();
    for (const auto& leg : root["legs"]) {
      LegLayout layout;
      layout.id = leg.value("id", std::string());
      if (leg.contains("hip_offset")) {
        const auto& off = leg["hip_offset"];
        layout.hip_offset = {off.at(0).get<float>(), off.at(1).get<float>()};
      }
      cfg.legs.push_back(layout);
    }
  }
  read_float(root, "initial_foot_spread", cfg.initial_foot_spread);
  return cfg;
}
#endif

#if BSK_ENABLE_DATA_YAML
void read_float(const YAML::Node& node, const char* key, float& out) {
  if (node[key]) out = node[key].as<float>();
}

void read_joint(const YAML::Node& node, const char* key, JointSkin& out) {
  const YAML::Node joint = node[key];
  if (!joint) return;
  read_float(joint, "radius", out.radius);
  read_float(joint, "weight", out.weight);
}

CreatureConfig parse_yaml(const YAML::Node& doc) {
  CreatureConfig cfg;
  const YAML::Node root = doc["creature"] ? doc["creature"] : doc;

  if (const YAML::Node ik = root["ik"]) {
    read_float(ik, "l1", cfg.ik.l1);
    read_float(ik, "l2", cfg.ik.l2);
  }
  if (const YAML::Node gait = root["gait"]) {
    read_float(gait, "step_trigger_distance", cfg.gait.step_trigger_distance);
    if (gait["step_duration_ticks"]) {
      cfg.gait.step_duration_ticks = gait["step_duration_ticks"].as<int>();
    }
    read_float(gait, "step_height", cfg.gait.step_height);
    read_float(gait, "step_lead", cfg.gait.step_lead);
    read_float(gait, "ideal_offset_scale", cfg.gait.ideal_offset_scale);
    if (gait["sequence"]) {
      cfg.gait.sequence.clear();
      for (const auto& v : gait["sequence"]) {
        cfg.gait.sequence.push_back(v.as<int>());
      }
    }
  }
  if (const YAML::Node skin = root["skin"]) {
    read_joint(skin, "core", cfg.skin.core);
    read_joint(skin, "hip", cfg.skin.hip);
    read_joint(skin, "knee", cfg.skin.knee);
    read_joint(skin, "foot", cfg.skin.foot);
    read_float(skin, "hip_radius_scale", cfg.skin.hip_radius_scale);
    read_float(skin, "foot_step_shrink", cfg.skin.foot_step_shrink);
    read_float(skin, "iso_threshold", cfg.skin.iso_threshold);
    read_float(skin, "cell_size", cfg.skin.cell_size);
    read_float(skin, "padding", cfg.skin.padding);
  }
  if (const YAML::Node loco = root["locomotion"]) {
    read_float(loco, "core_lerp", cfg.locomotion.core_lerp);
    read_float(loco, "short_hop_distance", cfg.locomotion.short_hop_distance);
    read_float(loco, "snap_distance", cfg.locomotion.snap_distance);
    read_float(loco, "wobble_amplitude", cfg.locomotion.wobble_amplitude);
  }
  if (const YAML::Node legs = root["legs"]) {
    cfg.legs.clear();
    for (const auto& leg : legs) {
      LegLayout layout;
      if (leg["id"]) layout.id = leg["id"].as<std::string>();
      if (const YAML::Node off = leg["hip_offset"]) {
        layout.hip_offset = {off[0].as<float>(), off[1].as<float>()};
      }
      cfg.legs.push_back(layout);
    }
  }
  read_float(root, "initial_foot_spread", cfg.initial_foot_spread);
  return cfg;
}
#endif
} // namespace

std::vector<LegLayout> CreatureConfig::default_leg_layout() {
  return {
      {"FL", {-30.0f, -30.0f}},
      {"FR", {30.0f, -30.0f}},
      {"BL", {-30.0f, 30.0f}},
      {"BR", {30.0f, 30.0f}},
  };
}

CreatureConfig load_creature_config(const std::filesystem::path& path,
                                    std::vector<std::string>* errors) {
  if (!file_exists(path)) {
    report(errors, std::string("config not found: ") + path.string());
    return CreatureConfig{};
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
#if BSK_ENABLE_DATA_JSON
    std::ifstream in(path);
    try {
      nlohmann::json j;
      in >> j;
      return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
      report(errors, std::string("config parse failed (") + path.string() + "): " + e.what());
    }
#else
    report(errors, "JSON support is disabled, cannot load " + path.string());
#endif
    return CreatureConfig{};
  }

  if (ext == ".yaml" || ext == ".yml") {
#if BSK_ENABLE_DATA_YAML
    try {
      return parse_yaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
      report(errors, std::string("config parse failed (") + path.string() + "): " + e.what());
    }
#else
    report(errors, "YAML support is disabled, cannot load " + path.string());
#endif
    return CreatureConfig{};
  }

  report(errors, "unknown config extension '" + path.extension().string() + "': " + path.string());
  return CreatureConfig{};
}

bool validate_creature_config(const CreatureConfig& cfg, std::vector<std::string>& errors) {
  const size_t before = errors.size();
  auto require_positive = [&](float v, const char* name) {
    if (!(v > 0.0f)) {
      errors.push_back(std::string(name) + " must be > 0");
    }
  };

  require_positive(cfg.ik.l1, "ik.l1");
  require_positive(cfg.ik.l2, "ik.l2");
  if (cfg.gait.step_duration_ticks < 1) {
    errors.push_back("gait.step_duration_ticks must be >= 1");
  }
  if (cfg.gait.step_trigger_distance < 0.0f) {
    errors.push_back("gait.step_trigger_distance must be >= 0");
  }
  require_positive(cfg.skin.core.radius, "skin.core.radius");
  require_positive(cfg.skin.hip.radius, "skin.hip.radius");
  require_positive(cfg.skin.knee.radius, "skin.knee.radius");
  require_positive(cfg.skin.foot.radius, "skin.foot.radius");
  require_positive(cfg.skin.hip_radius_scale, "skin.hip_radius_scale");
  require_positive(cfg.skin.iso_threshold, "skin.iso_threshold");
  require_positive(cfg.skin.cell_size, "skin.cell_size");
  if (cfg.skin.padding < 0.0f) {
    errors.push_back("skin.padding must be >= 0");
  }
  if (cfg.skin.foot_step_shrink < 0.0f || cfg.skin.foot_step_shrink >= 1.0f) {
    errors.push_back("skin.foot_step_shrink must be in [0, 1)");
  }

  if (cfg.legs.empty()) {
    errors.push_back("legs must not be empty");
  }
  std::set<std::string> ids;
  for (size_t i = 0; i < cfg.legs.size(); ++i) {
    const auto& id = cfg.legs[i].id;
    if (id.empty()) {
      errors.push_back("legs[" + std::to_string(i) + "].id is empty");
    } else if (!ids.insert(id).second) {
      errors.push_back("duplicate leg id: " + id);
    }
  }

  if (!cfg.gait.sequence.empty()) {
    std::vector<int> sorted = cfg.gait.sequence;
    std::sort(sorted.begin(), sorted.end());
    std::vector<int> expected(cfg.legs.size());
    std::iota(expected.begin(), expected.end(), 0);
    if (sorted != expected) {
      std::ostringstream oss;
      oss << "gait.sequence must be a permutation of 0.." << (static_cast<int>(cfg.legs.size()) - 1);
      errors.push_back(oss.str());
    }
  }

  return errors.size() == before;
}

std::vector<int> resolve_gait_sequence(const GaitParams& gait, size_t leg_count) {
  if (!gait.sequence.empty() && gait.sequence.size() == leg_count) {
    return gait.sequence;
  }
  if (leg_count == 4) {
    return {0, 3, 1, 2};
  }
  std::vector<int> order(leg_count);
  std::iota(order.begin(), order.end(), 0);
  return order;
}

} // namespace bsk
