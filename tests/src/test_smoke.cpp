#include "bsk/config.h"
#include "bsk/creature.h"
#include "bsk/field.h"
#include "bsk/gait.h"
#include "bsk/ik.h"
#include "bsk/json_write.h"
#include "bsk/locomotion.h"
#include "bsk/log.h"
#include "bsk/marching_squares.h"
#include "bsk/math.h"
#include "bsk/movement_log.h"
#include "bsk/paths.h"
#include "bsk/rng.h"
#include "bsk/skeleton.h"
#include "bsk/world.h"
#include "bsk_platform/file_watcher.h"
#include "bskctl/cli_api.h"

#if BSK_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

std::string read_text(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool near(float a, float b, float eps) {
  return std::fabs(a - b) <= eps;
}

bool near(const bsk::Vec2& a, const bsk::Vec2& b, float eps) {
  return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

bool same(const bsk::Vec2& a, const bsk::Vec2& b) {
  return a.x == b.x && a.y == b.y;
}

// Single-cell grid with corners ordered (0,0), (1,0), (1,1), (0,1).
bsk::SamplingGrid unit_cell(float c0, float c1, float c2, float c3) {
  bsk::SamplingGrid grid;
  grid.cell_size = 1.0f;
  grid.cols = 1;
  grid.rows = 1;
  grid.values.assign(4, 0.0f);
  grid.value(0, 0) = c0;
  grid.value(1, 0) = c1;
  grid.value(1, 1) = c2;
  grid.value(0, 1) = c3;
  return grid;
}

int main(int argc, char** argv) {
  const auto paths = bsk::resolve_paths(argc > 0 ? argv[0] : nullptr, std::nullopt);
  bsk::log::init("bsk_tests", paths.root);

  int failures = 0;
  const fs::path temp_root = fs::temp_directory_path() / "bsk_tests";
  std::error_code ec;
  fs::remove_all(temp_root, ec);

  // Test: two-bone IK places the knee at the law-of-cosines solution.
  {
    const bsk::Vec2 knee = bsk::ik::solve_two_bone({0.0f, 0.0f}, {70.0f, 0.0f}, 58.0f, 35.0f, true);
    if (!near(knee, {50.28f, 28.91f}, 0.05f)) {
      std::cerr << "ik knee mismatch: " << knee.x << "," << knee.y << "\n";
      ++failures;
    }
    if (!near(bsk::vec2_length(knee), 58.0f, 1e-3f) ||
        !near(bsk::vec2_distance(knee, {70.0f, 0.0f}), 35.0f, 1e-2f)) {
      std::cerr << "ik bone lengths not preserved\n";
      ++failures;
    }
    const bsk::Vec2 mirrored = bsk::ik::solve_two_bone({0.0f, 0.0f}, {70.0f, 0.0f}, 58.0f, 35.0f, false);
    if (!near(mirrored, {knee.x, -knee.y}, 1e-3f)) {
      std::cerr << "ik bend direction does not mirror\n";
      ++failures;
    }
  }

  // Test: IK with an out-of-reach target straightens toward it.
  {
    const bsk::Vec2 origin{10.0f, 20.0f};
    const bsk::Vec2 target{310.0f, 20.0f};
    const bsk::Vec2 knee = bsk::ik::solve_two_bone(origin, target, 58.0f, 35.0f, true);
    if (!near(bsk::vec2_distance(origin, knee), 58.0f, 1e-3f)) {
      std::cerr << "ik clamped knee not at l1\n";
      ++failures;
    }
    const float angle = std::atan2(knee.y - origin.y, knee.x - origin.x);
    if (std::fabs(angle) > 0.05f) {
      std::cerr << "ik clamped knee off the target line: " << angle << "\n";
      ++failures;
    }
  }

  // Test: IK with the target on the origin stays finite.
  {
    const bsk::Vec2 knee = bsk::ik::solve_two_bone({5.0f, 5.0f}, {5.0f, 5.0f}, 58.0f, 35.0f, true);
    if (!std::isfinite(knee.x) || !std::isfinite(knee.y) ||
        !near(bsk::vec2_distance({5.0f, 5.0f}, knee), 58.0f, 1e-3f)) {
      std::cerr << "ik degenerate target produced invalid knee\n";
      ++failures;
    }
  }

  // Test: skeleton creation spreads feet and solves knees.
  {
    const bsk::CreatureConfig cfg;
    const bsk::Skeleton skel = bsk::create_skeleton(cfg, {100.0f, 100.0f});
    if (skel.legs.size() != 4) {
      std::cerr << "skeleton leg count mismatch\n";
      ++failures;
    }
    for (const auto& leg : skel.legs) {
      const bsk::Vec2 expected_foot = bsk::vec2_add(skel.core_position, bsk::vec2_mul(leg.hip_offset, 2.5f));
      if (!near(leg.foot, expected_foot, 1e-4f)) {
        std::cerr << "initial foot misplaced for " << leg.id << "\n";
        ++failures;
      }
      const bsk::Vec2 hip = bsk::hip_position(skel, leg);
      if (!near(bsk::vec2_distance(hip, leg.knee), cfg.ik.l1, 1e-3f) ||
          !near(bsk::vec2_distance(leg.knee, leg.foot), cfg.ik.l2, 1e-2f)) {
        std::cerr << "initial knee not solved for " << leg.id << "\n";
        ++failures;
      }
      if (leg.is_stepping() || leg.step_progress() != 1.0f) {
        std::cerr << "new leg should be planted\n";
        ++failures;
      }
    }
    const bsk::Leg* br = bsk::find_leg(skel, "BR");
    if (!br || !br->bends_right() || bsk::find_leg(skel, "XX")) {
      std::cerr << "find_leg lookup failed\n";
      ++failures;
    }
    const bsk::Bounds bounds = bsk::skeleton_bounds(skel);
    if (bounds.min.x > 100.0f - 75.0f + 1e-3f || bounds.max.x < 100.0f + 75.0f - 1e-3f) {
      std::cerr << "skeleton bounds do not cover feet\n";
      ++failures;
    }
  }

  // Test: a swing eases along its arc and lands exactly on the target.
  {
    bsk::GaitParams params;
    params.step_duration_ticks = 4;
    bsk::Leg leg;
    leg.foot = {0.0f, 0.0f};
    if (!bsk::gait::start_step(leg, {40.0f, 0.0f}) || bsk::gait::start_step(leg, {1.0f, 1.0f})) {
      std::cerr << "start_step should only succeed on an idle leg\n";
      ++failures;
    }
    float last_progress = 0.0f;
    int ticks = 0;
    bsk::gait::StepStatus status = bsk::gait::StepStatus::InFlight;
    while (status == bsk::gait::StepStatus::InFlight && ticks < 100) {
      status = bsk::gait::advance_step(leg, params);
      ++ticks;
      if (status == bsk::gait::StepStatus::InFlight) {
        if (leg.step_progress() <= last_progress) {
          std::cerr << "step progress not increasing\n";
          ++failures;
        }
        last_progress = leg.step_progress();
        if (leg.foot.y >= 0.0f) {
          std::cerr << "mid-swing foot should be lifted\n";
          ++failures;
        }
      }
    }
    if (ticks != params.step_duration_ticks || status != bsk::gait::StepStatus::Completed) {
      std::cerr << "swing length mismatch: " << ticks << "\n";
      ++failures;
    }
    if (!same(leg.foot, {40.0f, 0.0f}) || leg.is_stepping() || leg.step_progress() != 1.0f) {
      std::cerr << "landed foot not on target\n";
      ++failures;
    }
    if (bsk::gait::advance_step(leg, params) != bsk::gait::StepStatus::Idle) {
      std::cerr << "idle leg should not advance\n";
      ++failures;
    }
  }

  // Test: gait keeps one leg in the air and cycles the diagonal order.
  {
    const bsk::CreatureConfig cfg;
    bsk::Skeleton skel = bsk::create_skeleton(cfg, {0.0f, 0.0f});
    bsk::gait::GaitScheduler scheduler(skel.legs.size(), cfg.gait);
    const std::vector<int> expected_order{0, 3, 1, 2};
    if (scheduler.sequence() != expected_order || scheduler.next_leg() != 0) {
      std::cerr << "default gait sequence mismatch\n";
      ++failures;
    }

    std::vector<size_t> starts;
    std::vector<float> last_progress(skel.legs.size(), 0.0f);
    std::vector<uint64_t> start_tick(skel.legs.size(), 0);
    for (uint64_t tick = 1; tick <= 2000; ++tick) {
      skel.core_velocity = {5.0f, 0.0f};
      skel.core_position = bsk::vec2_add(skel.core_position, skel.core_velocity);
      const bsk::gait::TickResult result = scheduler.tick(skel, cfg.gait);
      bsk::solve_knees(skel, cfg.ik);

      if (bsk::stepping_leg_count(skel) > 1) {
        std::cerr << "more than one leg stepping at tick " << tick << "\n";
        ++failures;
        break;
      }
      if (result.started) {
        starts.push_back(result.started->leg_index);
        start_tick[result.started->leg_index] = tick;
        last_progress[result.started->leg_index] = 0.0f;
      }
      for (const auto& done : result.completed) {
        const bsk::Leg& leg = skel.legs[done.leg_index];
        if (!same(leg.foot, done.target)) {
          std::cerr << "completed step foot not on target\n";
          ++failures;
        }
        if (tick - start_tick[done.leg_index] + 1 != static_cast<uint64_t>(cfg.gait.step_duration_ticks)) {
          std::cerr << "step did not last step_duration_ticks\n";
          ++failures;
        }
      }
      for (size_t i = 0; i < skel.legs.size(); ++i) {
        const bsk::Leg& leg = skel.legs[i];
        if (!leg.is_stepping()) continue;
        if (leg.step_progress() <= last_progress[i] || leg.step_progress() > 1.0f) {
          std::cerr << "step progress not monotonic\n";
          ++failures;
        }
        last_progress[i] = leg.step_progress();
      }
    }
    if (starts.size() < 8) {
      std::cerr << "too few steps while walking: " << starts.size() << "\n";
      ++failures;
    }
    for (size_t k = 0; k < starts.size(); ++k) {
      if (static_cast<int>(starts[k]) != expected_order[k % expected_order.size()]) {
        std::cerr << "gait order broken at step " << k << "\n";
        ++failures;
        break;
      }
    }
  }

  // Test: a standing creature does not step.
  {
    const bsk::CreatureConfig cfg;
    bsk::Skeleton skel = bsk::create_skeleton(cfg, {0.0f, 0.0f});
    bsk::gait::GaitScheduler scheduler(skel.legs.size(), cfg.gait);
    for (int tick = 0; tick < 120; ++tick) {
      const auto result = scheduler.tick(skel, cfg.gait);
      if (result.started) {
        std::cerr << "standing creature started a step\n";
        ++failures;
        break;
      }
    }
  }

  // Test: a triggered step targets the hip offset plus the velocity lead.
  {
    const bsk::CreatureConfig cfg;
    bsk::Skeleton skel = bsk::create_skeleton(cfg, {0.0f, 0.0f});
    bsk::gait::GaitScheduler scheduler(skel.legs.size(), cfg.gait);
    skel.core_position = {100.0f, 0.0f};
    skel.core_velocity = {4.0f, -2.0f};
    // FL: hip (70,-30), offset (-30,-30) * 1.5, lead (4,-2) * 1.5.
    const bsk::Vec2 expected{31.0f, -78.0f};
    if (!same(bsk::gait::ideal_foot_position(skel, skel.legs[0], cfg.gait), expected)) {
      std::cerr << "ideal foot position mismatch\n";
      ++failures;
    }
    const bsk::Vec2 foot_before = skel.legs[0].foot;
    const bsk::gait::TickResult result = scheduler.tick(skel, cfg.gait);
    if (!result.started || result.started->leg_index != 0 || !same(result.started->target, expected) ||
        !same(result.started->start, foot_before)) {
      std::cerr << "started step event mismatch\n";
      ++failures;
    }
    if (!skel.legs[0].swing || !same(skel.legs[0].swing->target, expected)) {
      std::cerr << "swing target should be the led ideal foot\n";
      ++failures;
    }
  }

  // Test: field is weight at the centre and zero at the radius.
  {
    const std::vector<bsk::JointInfluence> influences{{{0.0f, 0.0f}, 50.0f, 1.0f}};
    if (!near(bsk::evaluate_field({0.0f, 0.0f}, influences), 1.0f, 1e-6f)) {
      std::cerr << "field centre value mismatch\n";
      ++failures;
    }
    if (bsk::evaluate_field({50.0f, 0.0f}, influences) != 0.0f ||
        bsk::evaluate_field({80.0f, 0.0f}, influences) != 0.0f) {
      std::cerr << "field should vanish at and beyond the radius\n";
      ++failures;
    }
    if (!near(bsk::evaluate_field({25.0f, 0.0f}, influences), 0.421875f, 1e-5f)) {
      std::cerr << "field falloff mismatch\n";
      ++failures;
    }
    const std::vector<bsk::JointInfluence> pair{{{0.0f, 0.0f}, 50.0f, 1.0f}, {{10.0f, 0.0f}, 50.0f, 0.5f}};
    if (bsk::evaluate_field({5.0f, 0.0f}, pair) <= bsk::evaluate_field({5.0f, 0.0f}, influences)) {
      std::cerr << "field contributions should sum\n";
      ++failures;
    }
    if (!near(bsk::iso_radius(influences[0], 0.25f), 30.42f, 0.01f) ||
        bsk::iso_radius(influences[0], 1.5f) != 0.0f) {
      std::cerr << "iso_radius mismatch\n";
      ++failures;
    }
  }

  // Test: marching squares case table.
  {
    // Edge midpoints of the unit cell: e0 bottom, e1 right, e2 top, e3 left.
    const bsk::Vec2 mid[4] = {{0.5f, 0.0f}, {1.0f, 0.5f}, {0.5f, 1.0f}, {0.0f, 0.5f}};
    // Edge pairs per case, saddles 5 and 10 resolved as separate corners.
    const int pairs[16][4] = {
        {-1, -1, -1, -1}, {3, 0, -1, -1}, {0, 1, -1, -1}, {3, 1, -1, -1},
        {1, 2, -1, -1},   {0, 1, 2, 3},   {0, 2, -1, -1}, {3, 2, -1, -1},
        {3, 2, -1, -1},   {0, 2, -1, -1}, {3, 0, 1, 2},   {1, 2, -1, -1},
        {3, 1, -1, -1},   {0, 1, -1, -1}, {3, 0, -1, -1}, {-1, -1, -1, -1},
    };
    for (int index = 0; index < 16; ++index) {
      const bsk::SamplingGrid grid = unit_cell((index & 1) ? 1.0f : 0.0f, (index & 2) ? 1.0f : 0.0f,
                                               (index & 4) ? 1.0f : 0.0f, (index & 8) ? 1.0f : 0.0f);
      if (bsk::classify_cell(grid, 0, 0, 0.5f) != index) {
        std::cerr << "classify_cell mismatch for case " << index << "\n";
        ++failures;
      }
      std::vector<bsk::Segment> segments;
      bsk::extract_contours(grid, 0.5f, segments);
      const size_t expected = (index == 0 || index == 15) ? 0 : (index == 5 || index == 10) ? 2 : 1;
      if (segments.size() != expected) {
        std::cerr << "segment count mismatch for case " << index << "\n";
        ++failures;
        continue;
      }
      for (size_t k = 0; k < segments.size(); ++k) {
        const bsk::Vec2& a = mid[pairs[index][2 * k]];
        const bsk::Vec2& b = mid[pairs[index][2 * k + 1]];
        if (!near(segments[k].p0, a, 1e-6f) || !near(segments[k].p1, b, 1e-6f)) {
          std::cerr << "case " << index << " segment " << k << " joins the wrong edges\n";
          ++failures;
        }
      }
    }
    std::vector<bsk::Segment> segments;
    bsk::extract_contours(unit_cell(1.0f, 0.0f, 0.0f, 0.0f), 0.5f, segments);
    if (segments.size() != 1 || !near(segments[0].p0, {0.0f, 0.5f}, 1e-6f) ||
        !near(segments[0].p1, {0.5f, 0.0f}, 1e-6f)) {
      std::cerr << "case 1 segment misplaced\n";
      ++failures;
    }
    segments.clear();
    bsk::extract_contours(unit_cell(1.0f, 0.0f, 0.0f, 0.0f), 0.75f, segments);
    if (segments.size() != 1 || !near(segments[0].p1, {0.25f, 0.0f}, 1e-6f)) {
      std::cerr << "edge interpolation mismatch\n";
      ++failures;
    }
    if (bsk::classify_cell(unit_cell(0.25f, 0.0f, 0.0f, 0.0f), 0, 0, 0.25f) != 1) {
      std::cerr << "corner equal to iso should count as inside\n";
      ++failures;
    }
  }

  // Test: a single metaball contours to a circle at its iso radius.
  {
    const bsk::JointInfluence ball{{12.0f, -7.0f}, 50.0f, 1.0f};
    const float cell = 4.0f;
    const float expected_r = bsk::iso_radius(ball, 0.25f);
    const auto segments = bsk::extract_contours({ball}, cell, 0.25f, 100.0f);
    if (segments.size() < 16) {
      std::cerr << "circle contour too sparse: " << segments.size() << "\n";
      ++failures;
    }
    for (const auto& s : segments) {
      const float r0 = bsk::vec2_distance(s.p0, ball.position);
      const float r1 = bsk::vec2_distance(s.p1, ball.position);
      if (!near(r0, expected_r, cell) || !near(r1, expected_r, cell)) {
        std::cerr << "contour point off the iso circle: " << r0 << " / " << r1 << "\n";
        ++failures;
        break;
      }
    }
    const bsk::SamplingGrid grid = bsk::build_sampling_grid({ball}, cell, 100.0f);
    if (grid.empty() || std::fmod(grid.origin_x, cell) != 0.0f || std::fmod(grid.origin_y, cell) != 0.0f ||
        grid.values.size() != static_cast<size_t>(grid.cols + 1) * static_cast<size_t>(grid.rows + 1)) {
      std::cerr << "sampling grid not snapped to cell size\n";
      ++failures;
    }
    if (grid.origin_x > ball.position.x - ball.radius - 100.0f ||
        grid.vertex(grid.cols, grid.rows).x < ball.position.x + ball.radius + 100.0f) {
      std::cerr << "sampling grid does not cover padded bounds\n";
      ++failures;
    }
  }

  // Test: empty and zero-area inputs give no contour.
  {
    if (!bsk::extract_contours({}, 4.0f, 0.25f, 100.0f).empty() ||
        !bsk::build_sampling_grid({}, 4.0f, 100.0f).empty()) {
      std::cerr << "empty influence set should give no contour\n";
      ++failures;
    }
    const std::vector<bsk::JointInfluence> point{{{4.0f, 4.0f}, 0.0f, 1.0f}};
    if (!bsk::build_sampling_grid(point, 4.0f, 0.0f).empty() ||
        !bsk::extract_contours(point, 4.0f, 0.25f, 0.0f).empty()) {
      std::cerr << "zero-area grid should be empty\n";
      ++failures;
    }
    const std::vector<bsk::JointInfluence> faint{{{0.0f, 0.0f}, 50.0f, 0.1f}};
    if (!bsk::extract_contours(faint, 4.0f, 0.25f, 10.0f).empty()) {
      std::cerr << "field below iso everywhere should give no contour\n";
      ++failures;
    }
  }

  // Test: config validation.
  {
    std::vector<std::string> errors;
    if (!bsk::validate_creature_config(bsk::CreatureConfig{}, errors) || !errors.empty()) {
      std::cerr << "default config should validate\n";
      ++failures;
    }
    bsk::CreatureConfig bad;
    bad.ik.l1 = 0.0f;
    bad.gait.step_duration_ticks = 0;
    bad.skin.cell_size = -1.0f;
    bad.legs[1].id = "FL";
    bad.gait.sequence = {0, 0, 1, 2};
    errors.clear();
    if (bsk::validate_creature_config(bad, errors) || errors.size() < 5) {
      std::cerr << "invalid config accepted (" << errors.size() << " errors)\n";
      ++failures;
    }
    bsk::GaitParams gait;
    if (bsk::resolve_gait_sequence(gait, 4) != std::vector<int>{0, 3, 1, 2} ||
        bsk::resolve_gait_sequence(gait, 3) != std::vector<int>{0, 1, 2}) {
      std::cerr << "default gait sequence resolution failed\n";
      ++failures;
    }
    gait.sequence = {3, 2, 1, 0};
    if (bsk::resolve_gait_sequence(gait, 4) != gait.sequence ||
        bsk::resolve_gait_sequence(gait, 6).size() != 6) {
      std::cerr << "configured gait sequence resolution failed\n";
      ++failures;
    }
    std::vector<std::string> load_errors;
    const bsk::CreatureConfig missing = bsk::load_creature_config(temp_root / "missing.yaml", &load_errors);
    if (missing.ik.l1 != 58.0f || missing.legs.size() != 4) {
      std::cerr << "missing config should load defaults\n";
      ++failures;
    }
    if (load_errors.size() != 1 || load_errors[0].find("not found") == std::string::npos) {
      std::cerr << "missing config should be reported\n";
      ++failures;
    }
    load_errors.clear();
    const fs::path toml = temp_root / "creature.toml";
    write_text(toml, "[ik]\nl1 = 40\n");
    const bsk::CreatureConfig unknown = bsk::load_creature_config(toml, &load_errors);
    if (unknown.ik.l1 != 58.0f || load_errors.size() != 1 ||
        load_errors[0].find("unknown config extension") == std::string::npos) {
      std::cerr << "unknown config extension should be reported\n";
      ++failures;
    }
    std::ostringstream rejected;
    if (run_validate(unknown, load_errors, rejected) != 1 ||
        rejected.str().find("\"ok\":false") == std::string::npos) {
      std::cerr << "validate should fail on an unloadable config\n";
      ++failures;
    }
  }

#if BSK_ENABLE_DATA_JSON
  // Test: JSON config loading with partial overrides.
  {
    const fs::path path = temp_root / "creature.json";
    write_text(path, R"({"creature":{"ik":{"l1":40},"gait":{"step_duration_ticks":12,"sequence":[1,0]},)"
                     R"("skin":{"core":{"radius":64}},)"
                     R"("legs":[{"id":"L","hip_offset":[-20,0]},{"id":"R","hip_offset":[20,0]}]}})");
    std::vector<std::string> errors;
    const bsk::CreatureConfig cfg = bsk::load_creature_config(path, &errors);
    if (!errors.empty() || cfg.ik.l1 != 40.0f || cfg.ik.l2 != 35.0f || cfg.gait.step_duration_ticks != 12 ||
        cfg.skin.core.radius != 64.0f || cfg.skin.core.weight != 1.2f || cfg.legs.size() != 2 ||
        cfg.legs[1].id != "R" || cfg.legs[1].hip_offset.x != 20.0f) {
      std::cerr << "json config load mismatch\n";
      ++failures;
    }
    if (!bsk::validate_creature_config(cfg, errors)) {
      std::cerr << "json config should validate\n";
      ++failures;
    }
    const bsk::Creature biped(cfg, {0.0f, 0.0f});
    if (biped.scheduler().sequence() != std::vector<int>{1, 0}) {
      std::cerr << "configured sequence not applied\n";
      ++failures;
    }

    write_text(path, "{ not json");
    errors.clear();
    const bsk::CreatureConfig broken = bsk::load_creature_config(path, &errors);
    if (errors.empty() || broken.ik.l1 != 58.0f) {
      std::cerr << "malformed json should report and fall back\n";
      ++failures;
    }
  }
#endif

#if BSK_ENABLE_DATA_YAML
  // Test: YAML config loading.
  {
    const fs::path path = temp_root / "creature.yaml";
    write_text(path,
               "creature:\n"
               "  gait:\n"
               "    step_trigger_distance: 45\n"
               "    step_height: 10\n"
               "  skin:\n"
               "    iso_threshold: 0.3\n"
               "    knee: { radius: 55, weight: 0.5 }\n"
               "  locomotion:\n"
               "    snap_distance: 3\n");
    std::vector<std::string> errors;
    const bsk::CreatureConfig cfg = bsk::load_creature_config(path, &errors);
    if (!errors.empty() || cfg.gait.step_trigger_distance != 45.0f || cfg.gait.step_height != 10.0f ||
        !near(cfg.skin.iso_threshold, 0.3f, 1e-6f) || cfg.skin.knee.radius != 55.0f ||
        cfg.locomotion.snap_distance != 3.0f || cfg.legs.size() != 4) {
      std::cerr << "yaml config load mismatch\n";
      ++failures;
    }

    write_text(path, "creature:\n  ik: { l1: [oops\n");
    errors.clear();
    bsk::load_creature_config(path, &errors);
    if (errors.empty()) {
      std::cerr << "malformed yaml should report\n";
      ++failures;
    }
  }

  // Test: shipped config validates.
  {
    const fs::path shipped = paths.config_dir / "creature.yaml";
    if (fs::exists(shipped)) {
      std::vector<std::string> errors;
      const bsk::CreatureConfig cfg = bsk::load_creature_config(shipped, &errors);
      if (!bsk::validate_creature_config(cfg, errors) || cfg.gait.sequence != std::vector<int>{0, 3, 1, 2}) {
        std::cerr << "shipped creature.yaml invalid\n";
        ++failures;
      }
    }
  }
#endif

  // Test: locomotion snaps onto nearby targets.
  {
    const bsk::CreatureConfig cfg;
    bsk::Creature creature(cfg, {0.0f, 0.0f});
    creature.set_target({100.0f, 0.0f});
    for (int tick = 0; tick < 600; ++tick) {
      creature.update(1.0f / 60.0f);
    }
    if (!same(creature.skeleton().core_position, {100.0f, 0.0f}) ||
        !same(creature.skeleton().core_velocity, {0.0f, 0.0f})) {
      std::cerr << "short hop did not snap onto target\n";
      ++failures;
    }
    if (bsk::locomotion::follow_factor(cfg.locomotion, 100.0f, 1.0f) != 0.28f ||
        bsk::locomotion::follow_factor(cfg.locomotion, 0.0f, 0.0f) != 0.002f) {
      std::cerr << "follow factor not clamped\n";
      ++failures;
    }
  }

  // Test: a walking creature keeps the swing invariant and its skin.
  {
    const bsk::CreatureConfig cfg;
    bsk::Creature creature(cfg, {0.0f, 0.0f});
    creature.set_target({900.0f, 300.0f});
    int steps = 0;
    for (int tick = 0; tick < 400; ++tick) {
      if (creature.update(1.0f / 60.0f).started) ++steps;
      if (bsk::stepping_leg_count(creature.skeleton()) > 1) {
        std::cerr << "walking creature has two legs in the air\n";
        ++failures;
        break;
      }
    }
    if (steps == 0 || creature.skeleton().core_position.x < 400.0f) {
      std::cerr << "creature did not walk toward target\n";
      ++failures;
    }
    const auto influences = creature.collect_influences();
    if (influences.size() != 1 + 3 * creature.skeleton().legs.size()) {
      std::cerr << "influence count mismatch\n";
      ++failures;
    }
    const auto segments = creature.extract_contours();
    if (segments.empty()) {
      std::cerr << "walking creature has no outline\n";
      ++failures;
    }
    const bsk::Vec2 core = creature.skeleton().core_position;
    for (const auto& s : segments) {
      if (bsk::vec2_distance(s.p0, core) > 500.0f) {
        std::cerr << "outline segment far from the body\n";
        ++failures;
        break;
      }
    }
  }

  // Test: stepping feet shrink and hips are scaled.
  {
    const bsk::CreatureConfig cfg;
    bsk::Creature creature(cfg, {0.0f, 0.0f});
    bsk::Leg& leg = creature.skeleton().legs[2];
    bsk::GaitParams params = cfg.gait;
    bsk::gait::start_step(leg, bsk::vec2_add(leg.foot, {30.0f, 0.0f}));
    for (int i = 0; i < params.step_duration_ticks / 2; ++i) {
      bsk::gait::advance_step(leg, params);
    }
    const auto influences = creature.collect_influences();
    const bsk::JointInfluence& hip = influences[1 + 3 * 2];
    const bsk::JointInfluence& foot = influences[1 + 3 * 2 + 2];
    if (!near(hip.radius, 44.0f, 1e-4f) || !near(foot.radius, 37.5f, 1e-3f) ||
        !near(influences[3].radius, 50.0f, 1e-4f)) {
      std::cerr << "joint radii mismatch: hip " << hip.radius << " foot " << foot.radius << "\n";
      ++failures;
    }
  }

  // Test: offspring variation is seeded and bounded.
  {
    const bsk::CreatureConfig cfg;
    const bsk::Creature parent(cfg, {200.0f, 200.0f});
    bsk::Rng a(42);
    bsk::Rng b(42);
    const bsk::Creature child_a = bsk::spawn_offspring(parent, a);
    const bsk::Creature child_b = bsk::spawn_offspring(parent, b);
    if (child_a.variation().size_multiplier != child_b.variation().size_multiplier ||
        !same(child_a.skeleton().core_position, child_b.skeleton().core_position)) {
      std::cerr << "offspring not deterministic for a seed\n";
      ++failures;
    }
    const bsk::CreatureVariation v = child_a.variation();
    if (v.size_multiplier < 0.95f || v.size_multiplier > 1.05f || v.speed_multiplier < 0.95f ||
        v.speed_multiplier > 1.05f) {
      std::cerr << "offspring multipliers out of range\n";
      ++failures;
    }
    const bsk::Vec2 offset = bsk::vec2_sub(child_a.skeleton().core_position, parent.skeleton().core_position);
    if (std::fabs(offset.x) > 100.0f || std::fabs(offset.y) > 100.0f) {
      std::cerr << "offspring spawned too far\n";
      ++failures;
    }
    const auto influences = child_a.collect_influences();
    if (!near(influences[0].radius, 80.0f * v.size_multiplier, 1e-3f)) {
      std::cerr << "size multiplier not applied to skin\n";
      ++failures;
    }
  }

  // Test: config hot swap keeps the leg layout.
  {
    const bsk::CreatureConfig cfg;
    bsk::Creature creature(cfg, {0.0f, 0.0f});
    bsk::CreatureConfig next;
    next.ik.l1 = 70.0f;
    next.legs = {{"A", {-10.0f, 0.0f}}, {"B", {10.0f, 0.0f}}};
    creature.apply_config(next);
    if (creature.skeleton().legs.size() != 4 || creature.config().legs.size() != 4 ||
        creature.config().ik.l1 != 70.0f) {
      std::cerr << "apply_config changed the leg layout\n";
      ++failures;
    }
    const bsk::Leg& leg = creature.skeleton().legs[0];
    if (!near(bsk::vec2_distance(bsk::hip_position(creature.skeleton(), leg), leg.knee), 70.0f, 1e-3f)) {
      std::cerr << "apply_config did not re-solve knees\n";
      ++failures;
    }
  }

  // Test: world creation, ordering and removal.
  {
    const bsk::CreatureConfig cfg;
    bsk::World world;
    const bsk::Entity a = world.create_creature(cfg, {0.0f, 0.0f});
    const bsk::Entity b = world.create_creature(cfg, {500.0f, 0.0f});
    if (a == bsk::kInvalidEntity || b <= a || world.creature_count() != 2) {
      std::cerr << "world entity ids invalid\n";
      ++failures;
    }
    world.set_target(a, {50.0f, 0.0f});
    world.set_target(b, {450.0f, 0.0f});
    for (int tick = 0; tick < 10; ++tick) {
      world.update(1.0f / 60.0f);
    }
    if (world.get_creature(a)->skeleton().core_position.x <= 0.0f ||
        world.get_creature(b)->skeleton().core_position.x >= 500.0f) {
      std::cerr << "world update did not move creatures\n";
      ++failures;
    }
    const auto all = world.extract_all();
    if (all.size() != 2 || all[0].entity != a || all[1].entity != b || all[0].segments.empty()) {
      std::cerr << "world contour extraction mismatch\n";
      ++failures;
    }
    world.destroy_creature(a);
    if (world.get_creature(a) || world.set_target(a, {0.0f, 0.0f}) || world.creature_count() != 1) {
      std::cerr << "world destroy failed\n";
      ++failures;
    }
  }

  // Test: movement log records steps.
  {
    const fs::path trace = temp_root / "movement.log";
    bsk::movement_log::open(trace);
    const bsk::CreatureConfig cfg;
    bsk::Creature creature(cfg, {0.0f, 0.0f});
    creature.set_target({600.0f, 0.0f});
    for (int tick = 0; tick < 120; ++tick) {
      creature.update(1.0f / 60.0f);
    }
    bsk::movement_log::close();
    const std::string text = read_text(trace);
    if (text.find("step start") == std::string::npos || text.find("core t=") == std::string::npos) {
      std::cerr << "movement log missing entries\n";
      ++failures;
    }
    if (bsk::movement_log::enabled()) {
      std::cerr << "movement log still enabled after close\n";
      ++failures;
    }
  }

  // Test: log level filtering and recent lines.
  {
    bsk::log::set_console(bsk::log::Console::Off);
    bsk::log::set_level(bsk::log::Level::Warn);
    bsk::log::info("filtered info line");
    bsk::log::warn("kept warn line");
    bsk::log::set_level(bsk::log::Level::Info);
    bsk::log::set_console(bsk::log::Console::Stdout);
    const auto lines = bsk::log::recent(2);
    bool kept = false;
    for (const auto& line : lines) {
      if (line.find("filtered info line") != std::string::npos) {
        std::cerr << "info line not filtered at warn level\n";
        ++failures;
      }
      if (line.find("WARN: kept warn line") != std::string::npos) kept = true;
    }
    if (!kept || lines.size() > 2) {
      std::cerr << "recent log lines mismatch\n";
      ++failures;
    }
  }

  // Test: file watcher reports a new config file once.
  {
    const fs::path dir = temp_root / "watch";
    fs::create_directories(dir);
    bsk::platform::FileWatcher watcher;
    watcher.set_debounce(std::chrono::milliseconds(0));
    if (!watcher.start(dir)) {
      std::cerr << "file watcher failed to start (" << watcher.backend_name() << ")\n";
      ++failures;
    } else {
      const fs::path file = dir / "creature.yaml";
      write_text(file, "creature: {}\n");
      int hits = 0;
      std::vector<bsk::platform::FileChange> changes;
      for (int attempt = 0; attempt < 100 && hits == 0; ++attempt) {
        changes.clear();
        watcher.poll(changes);
        for (const auto& change : changes) {
          if (change.path.filename() == "creature.yaml" &&
              change.type != bsk::platform::FileChange::Type::Removed) {
            ++hits;
          }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      if (hits != 1) {
        std::cerr << "file watcher missed or duplicated a change: " << hits << "\n";
        ++failures;
      }
      watcher.stop();
    }
  }

  // Test: json writer output.
  {
    std::ostringstream out;
    bsk::json::Writer w(out);
    w.begin_object();
    w.key("p");
    w.point({1.5f, 2.0f});
    w.key("ok");
    w.value(true);
    w.key("n");
    w.null();
    w.key("s");
    w.value("a\"b");
    w.key("bad");
    w.value(std::nanf(""));
    w.end_object();
    w.finish();
    if (out.str() != "{\"p\":[1.5,2],\"ok\":true,\"n\":null,\"s\":\"a\\\"b\",\"bad\":null}\n") {
      std::cerr << "json writer output mismatch: " << out.str();
      ++failures;
    }
  }

  // Test: cli argument parsing.
  {
    bsk::Vec2 v{0.0f, 0.0f};
    if (!parse_vec2("3.5,-4", v) || v.x != 3.5f || v.y != -4.0f || parse_vec2("3", v) || parse_vec2("a,b", v)) {
      std::cerr << "parse_vec2 failed\n";
      ++failures;
    }
    SimulateOptions sim;
    std::string error;
    if (!parse_simulate_args({"--ticks", "30", "--every", "5", "--target", "10,20", "--contours"}, sim, error) ||
        sim.ticks != 30 || sim.every != 5 || sim.target.y != 20.0f || !sim.contours) {
      std::cerr << "parse_simulate_args failed: " << error << "\n";
      ++failures;
    }
    if (parse_simulate_args({"--every", "0"}, sim, error) || parse_simulate_args({"--ticks"}, sim, error)) {
      std::cerr << "parse_simulate_args accepted bad input\n";
      ++failures;
    }
    IkOptions ik;
    if (!parse_ik_args({"--origin", "0,0", "--target", "70,0", "--bend", "left"}, ik, error) || ik.bend_right ||
        parse_ik_args({"--l1", "-2"}, ik, error)) {
      std::cerr << "parse_ik_args failed\n";
      ++failures;
    }
  }

  // Test: cli commands.
  {
    IkOptions ik;
    ik.target = {70.0f, 0.0f};
    std::ostringstream ik_out;
    if (run_ik(ik, ik_out) != 0 || ik_out.str().find("\"knee\":[") == std::string::npos) {
      std::cerr << "run_ik output mismatch\n";
      ++failures;
    }

    bsk::CreatureConfig bad;
    bad.skin.iso_threshold = 0.0f;
    std::ostringstream validate_out;
    if (run_validate(bad, {}, validate_out) != 1 ||
        validate_out.str().find("skin.iso_threshold") == std::string::npos) {
      std::cerr << "run_validate should report errors\n";
      ++failures;
    }
    std::ostringstream ok_out;
    if (run_validate(bsk::CreatureConfig{}, {}, ok_out) != 0 ||
        ok_out.str().find("\"ok\":true") == std::string::npos) {
      std::cerr << "run_validate rejected defaults\n";
      ++failures;
    }

    SimulateOptions sim;
    sim.ticks = 40;
    sim.every = 10;
    sim.offspring = 1;
    sim.contours = true;
    std::ostringstream sim_out;
    if (run_simulate(sim, bsk::CreatureConfig{}, sim_out) != 0) {
      std::cerr << "run_simulate failed\n";
      ++failures;
    }
#if BSK_ENABLE_DATA_JSON
    const auto doc = nlohmann::json::parse(sim_out.str(), nullptr, false);
    if (doc.is_discarded() || doc["frames"].size() != 5 || doc["frames"][0]["creatures"].size() != 2 ||
        doc["frames"][4]["tick"].get<int>() != 40 || doc["frames"][0]["creatures"][0]["legs"].size() != 4 ||
        doc["frames"][0]["creatures"][0]["segments"].empty()) {
      std::cerr << "run_simulate json mismatch\n";
      ++failures;
    }
#endif
    std::ostringstream contours_out;
    SimulateOptions contours;
    contours.ticks = 5;
    if (run_contours(contours, bsk::CreatureConfig{}, contours_out) != 0 ||
        contours_out.str().find("\"segments\":[[[") == std::string::npos) {
      std::cerr << "run_contours output mismatch\n";
      ++failures;
    }
  }

  // Test: bskctl startup keeps log lines off stdout.
  {
    std::ostringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());
    const bsk::ResolvedPaths cli_paths = init_cli(argc > 0 ? argv[0] : nullptr, temp_root / "absent.yaml");
    std::cout.rdbuf(saved);
    bsk::log::set_console(bsk::log::Console::Stdout);
    bsk::log::init("bsk_tests", paths.root);
    if (!captured.str().empty()) {
      std::cerr << "bskctl startup wrote to stdout: " << captured.str() << "\n";
      ++failures;
    }
    bool warned = false;
    for (const auto& line : bsk::log::recent(10)) {
      if (line.find("creature config not found") != std::string::npos) warned = true;
    }
    if (!warned || cli_paths.creature_config != temp_root / "absent.yaml") {
      std::cerr << "missing config warning not logged\n";
      ++failures;
    }
  }

  // Test: relative config paths resolve against the working directory.
  {
    const char* prior = std::getenv("BSK_CONFIG");
    const std::string saved = prior ? prior : "";
    const fs::path relative = fs::path("conf") / "creature.yaml";
    ::setenv("BSK_CONFIG", relative.string().c_str(), 1);
    const auto from_env = bsk::resolve_paths(argc > 0 ? argv[0] : nullptr, std::nullopt);
    const auto from_flag = bsk::resolve_paths(argc > 0 ? argv[0] : nullptr, relative);
    if (prior) {
      ::setenv("BSK_CONFIG", saved.c_str(), 1);
    } else {
      ::unsetenv("BSK_CONFIG");
    }
    const fs::path expected = fs::current_path() / relative;
    if (from_env.creature_config != expected || from_flag.creature_config != expected) {
      std::cerr << "relative config paths resolved differently\n";
      ++failures;
    }
  }

  fs::remove_all(temp_root, ec);
  bsk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
