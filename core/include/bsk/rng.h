#pragma once

#include <cstdint>
#include <random>

namespace bsk {

// Explicitly seeded source for creature-to-creature variation.
class Rng {
 public:
  explicit Rng(uint64_t seed) : engine_(static_cast<std::mt19937::result_type>(seed)) {}

  // Uniform in [lo, hi).
  float uniform(float lo, float hi) {
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(engine_);
  }

 private:
  std::mt19937 engine_;
};

} // namespace bsk
