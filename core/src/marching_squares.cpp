#include "bsk/marching_squares.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace bsk {

namespace {
// Edge e0 joins corners 0-1, e1 joins 1-2, e2 joins 2-3, e3 joins 3-0.
// Each case lists up to two edge pairs; -1 terminates.
constexpr int8_t kCaseEdges[16][4] = {
    {-1, -1, -1, -1},  // 0
    {3, 0, -1, -1},    // 1
    {0, 1, -1, -1},    // 2
    {3, 1, -1, -1},    // 3
    {1, 2, -1, -1},    // 4
    {0, 1, 2, 3},      // 5 saddle
    {0, 2, -1, -1},    // 6
    {3, 2, -1, -1},    // 7
    {3, 2, -1, -1},    // 8
    {0, 2, -1, -1},    // 9
    {3, 0, 1, 2},      // 10 saddle
    {1, 2, -1, -1},    // 11
    {3, 1, -1, -1},    // 12
    {0, 1, -1, -1},    // 13
    {3, 0, -1, -1},    // 14
    {-1, -1, -1, -1},  // 15
};

Vec2 edge_crossing(const Vec2& a, const Vec2& b, float va, float vb, float iso) {
  // A crossing edge has one corner >= iso and one below, so va != vb.
  const float t = (iso - va) / (vb - va);
  return vec2_lerp(a, b, t);
}
} // namespace

void build_sampling_grid(const std::vector<JointInfluence>& influences, float cell_size, float padding,
                         SamplingGrid& grid) {
  grid.cols = 0;
  grid.rows = 0;
  grid.cell_size = cell_size;
  grid.values.clear();
  if (influences.empty() || !(cell_size > 0.0f)) {
    return;
  }

  float min_x = std::numeric_limits<float>::max();
  float min_y = std::numeric_limits<float>::max();
  float max_x = std::numeric_limits<float>::lowest();
  float max_y = std::numeric_limits<float>::lowest();
  for (const auto& p : influences) {
    min_x = std::min(min_x, p.position.x - p.radius);
    min_y = std::min(min_y, p.position.y - p.radius);
    max_x = std::max(max_x, p.position.x + p.radius);
    max_y = std::max(max_y, p.position.y + p.radius);
  }

  const float grid_min_x = std::floor((min_x - padding) / cell_size) * cell_size;
  const float grid_min_y = std::floor((min_y - padding) / cell_size) * cell_size;
  const float grid_max_x = std::ceil((max_x + padding) / cell_size) * cell_size;
  const float grid_max_y = std::ceil((max_y + padding) / cell_size) * cell_size;
  const int cols = static_cast<int>(std::lround((grid_max_x - grid_min_x) / cell_size));
  const int rows = static_cast<int>(std::lround((grid_max_y - grid_min_y) / cell_size));
  if (cols <= 0 || rows <= 0) {
    return;
  }

  grid.origin_x = grid_min_x;
  grid.origin_y = grid_min_y;
  grid.cols = cols;
  grid.rows = rows;
  grid.values.resize(static_cast<size_t>(cols + 1) * static_cast<size_t>(rows + 1));
  for (int i = 0; i <= cols; ++i) {
    for (int j = 0; j <= rows; ++j) {
      grid.value(i, j) = evaluate_field(grid.vertex(i, j), influences);
    }
  }
}

SamplingGrid build_sampling_grid(const std::vector<JointInfluence>& influences, float cell_size, float padding) {
  SamplingGrid grid;
  build_sampling_grid(influences, cell_size, padding, grid);
  return grid;
}

uint8_t classify_cell(const SamplingGrid& grid, int i, int j, float iso_threshold) {
  uint8_t index = 0;
  if (grid.value(i, j) >= iso_threshold) index |= 1;
  if (grid.value(i + 1, j) >= iso_threshold) index |= 2;
  if (grid.value(i + 1, j + 1) >= iso_threshold) index |= 4;
  if (grid.value(i, j + 1) >= iso_threshold) index |= 8;
  return index;
}

void extract_contours(const SamplingGrid& grid, float iso_threshold, std::vector<Segment>& out) {
  if (grid.empty()) return;
  for (int i = 0; i < grid.cols; ++i) {
    for (int j = 0; j < grid.rows; ++j) {
      const uint8_t index = classify_cell(grid, i, j, iso_threshold);
      if (index == 0 || index == 15) continue;

      const Vec2 corner[4] = {grid.vertex(i, j), grid.vertex(i + 1, j), grid.vertex(i + 1, j + 1),
                              grid.vertex(i, j + 1)};
      const float v[4] = {grid.value(i, j), grid.value(i + 1, j), grid.value(i + 1, j + 1),
                          grid.value(i, j + 1)};
      auto crossing = [&](int edge) {
        const int a = edge;
        const int b = (edge + 1) % 4;
        return edge_crossing(corner[a], corner[b], v[a], v[b], iso_threshold);
      };

      const int8_t* edges = kCaseEdges[index];
      for (int k = 0; k < 4 && edges[k] >= 0; k += 2) {
        out.push_back({crossing(edges[k]), crossing(edges[k + 1])});
      }
    }
  }
}

std::vector<Segment> extract_contours(const std::vector<JointInfluence>& influences,
                                      float cell_size,
                                      float iso_threshold,
                                      float padding) {
  std::vector<Segment> segments;
  const SamplingGrid grid = build_sampling_grid(influences, cell_size, padding);
  extract_contours(grid, iso_threshold, segments);
  return segments;
}

} // namespace bsk
