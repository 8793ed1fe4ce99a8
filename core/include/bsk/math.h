#pragma once

#include <cmath>

namespace bsk {

constexpr float kPi = 3.14159265358979323846f;

struct Vec2 {
  float x;
  float y;
};

Vec2 vec2_add(const Vec2& a, const Vec2& b);
Vec2 vec2_sub(const Vec2& a, const Vec2& b);
Vec2 vec2_mul(const Vec2& a, float s);
float vec2_dot(const Vec2& a, const Vec2& b);
float vec2_length_sq(const Vec2& v);
float vec2_length(const Vec2& v);
float vec2_distance(const Vec2& a, const Vec2& b);
Vec2 vec2_lerp(const Vec2& a, const Vec2& b, float t);

float lerpf(float a, float b, float t);
float clampf(float v, float lo, float hi);

} // namespace bsk
