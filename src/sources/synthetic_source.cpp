#include "sources/synthetic_source.hpp"

#include <cmath>
#include <limits>

#include "codec/frame_codec.hpp"
#include "core/timestamp.hpp"

namespace dl100_bridge::sources {
namespace {

std::uint32_t resolve_seed(const std::uint32_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return device();
}

}  // namespace

SyntheticSource::SyntheticSource(const std::uint32_t seed) : rng_(resolve_seed(seed)) {}

SyntheticTick SyntheticSource::tick(const std::int32_t prev_distance, const double cycle_seconds,
                                    const bool inject_zero) {
  const std::int32_t distance = inject_zero ? 0 : kBaseDistance + jitter_(rng_);

  std::int32_t velocity = 0;
  if (std::isfinite(cycle_seconds) && cycle_seconds > 0.0) {
    const double delta = static_cast<double>(distance) - static_cast<double>(prev_distance);
    const double rate = delta / cycle_seconds;
    if (std::fabs(rate) < 9.0e18) {
      velocity = codec::wrap_int32(std::llround(rate));
    } else {
      velocity = rate > 0.0 ? std::numeric_limits<std::int32_t>::max() : std::numeric_limits<std::int32_t>::min();
    }
  }

  return SyntheticTick{model::Record{core::unix_timestamp_now_ms(), distance, velocity}, distance};
}

}  // namespace dl100_bridge::sources
