#pragma once

#include <cstdint>
#include <random>

#include "model/record.hpp"

namespace dl100_bridge::sources {

struct SyntheticTick {
  model::Record record;
  std::int32_t prev_distance;
};

// Stand-in for the DL100 when no device is attached.
// Distance jitters uniformly around kBaseDistance; velocity is the first difference
// against the previous distance divided by the cycle length, rounded to nearest.
// That is a rate estimate, not a true derivative.
class SyntheticSource {
 public:
  static constexpr std::int32_t kBaseDistance = 2500;
  static constexpr std::int32_t kJitter = 500;

  // seed == 0 draws the seed from std::random_device.
  explicit SyntheticSource(std::uint32_t seed = 0);

  SyntheticTick tick(std::int32_t prev_distance, double cycle_seconds, bool inject_zero);

 private:
  std::mt19937 rng_;
  std::uniform_int_distribution<std::int32_t> jitter_{-kJitter, kJitter};
};

}  // namespace dl100_bridge::sources
