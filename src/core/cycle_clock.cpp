#include "core/cycle_clock.hpp"

#include <cmath>

namespace dl100_bridge::core {

CycleClock::CycleClock(const std::chrono::nanoseconds cycle) noexcept : cycle_(cycle) {}

bool CycleClock::should_fire_every(const std::uint64_t every_n_ticks) const noexcept {
  if (every_n_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_n_ticks) == 0;
}

std::chrono::nanoseconds CycleClock::remaining(const clock::time_point cycle_start,
                                               const clock::time_point now) const noexcept {
  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - cycle_start);
  if (elapsed >= cycle_) {
    return std::chrono::nanoseconds::zero();
  }
  return cycle_ - elapsed;
}

void CycleClock::advance() noexcept { ++tick_count_; }

std::chrono::nanoseconds cycle_from_seconds(const double seconds) noexcept {
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    return std::chrono::nanoseconds::zero();
  }
  if (seconds >= 9.2e9) {
    return std::chrono::nanoseconds::max();
  }
  return std::chrono::nanoseconds(static_cast<std::int64_t>(std::llround(seconds * 1e9)));
}

}  // namespace dl100_bridge::core
