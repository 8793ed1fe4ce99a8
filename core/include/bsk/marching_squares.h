#pragma once

#include "bsk/field.h"
#include "bsk/math.h"

#include <cstdint>
#include <vector>

namespace bsk {

struct Segment {
  Vec2 p0{0.0f, 0.0f};
  Vec2 p1{0.0f, 0.0f};
};

// Field samples at the (cols+1) x (rows+1) vertices of an axis-aligned grid.
// Lives for one draw; bounds follow the creature's current extent.
struct SamplingGrid {
  float origin_x = 0.0f;
  float origin_y = 0.0f;
  float cell_size = 0.0f;
  int cols = 0;
  int rows = 0;
  std::vector<float> values;

  bool empty() const { return cols <= 0 || rows <= 0; }
  float value(int i, int j) const { return values[static_cast<size_t>(i) * static_cast<size_t>(rows + 1) + static_cast<size_t>(j)]; }
  float& value(int i, int j) { return values[static_cast<size_t>(i) * static_cast<size_t>(rows + 1) + static_cast<size_t>(j)]; }
  Vec2 vertex(int i, int j) const {
    return {origin_x + static_cast<float>(i) * cell_size, origin_y + static_cast<float>(j) * cell_size};
  }
};

// Sizes the grid to the influences' bounding box (each grown by its radius)
// plus padding, snapped outward to cell_size, and samples the field at every
// vertex. An empty influence set or a zero-area box gives an empty grid.
SamplingGrid build_sampling_grid(const std::vector<JointInfluence>& influences, float cell_size, float padding);

// Same as above into a caller-owned grid so its buffer can be reused.
void build_sampling_grid(const std::vector<JointInfluence>& influences, float cell_size, float padding,
                         SamplingGrid& grid);

// 4-bit case index for cell (i, j): bit k set when corner k >= iso, corners
// ordered (i,j), (i+1,j), (i+1,j+1), (i,j+1).
uint8_t classify_cell(const SamplingGrid& grid, int i, int j, float iso_threshold);

// Appends the contour segments of a sampled grid. Saddles (5, 10) always emit
// their two separate segments.
void extract_contours(const SamplingGrid& grid, float iso_threshold, std::vector<Segment>& out);

std::vector<Segment> extract_contours(const std::vector<JointInfluence>& influences,
                                      float cell_size,
                                      float iso_threshold,
                                      float padding);

} // namespace bsk
