#include "bsk/math.h"

#include <algorithm>

namespace bsk {

Vec2 vec2_add(const Vec2& a, const Vec2& b) {
  return {a.x + b.x, a.y + b.y};
}

Vec2 vec2_sub(const Vec2& a, const Vec2& b) {
  return {a.x - b.x, a.y - b.y};
}

Vec2 vec2_mul(const Vec2& a, float s) {
  return {a.x * s, a.y * s};
}

float vec2_dot(const Vec2& a, const Vec2& b) {
  return a.x * b.x + a.y * b.y;
}

float vec2_length_sq(const Vec2& v) {
  return vec2_dot(v, v);
}

float vec2_length(const Vec2& v) {
  return std::sqrt(vec2_length_sq(v));
}

float vec2_distance(const Vec2& a, const Vec2& b) {
  return vec2_length(vec2_sub(b, a));
}

Vec2 vec2_lerp(const Vec2& a, const Vec2& b, float t) {
  return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

float lerpf(float a, float b, float t) {
  return a + (b - a) * t;
}

float clampf(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

} // namespace bsk
