#pragma once

#include <chrono>
#include <cstdint>

namespace dl100_bridge::core {

// Shortest cycle a worker accepts (1 kHz). A zero cycle would never sleep.
inline constexpr std::chrono::nanoseconds kMinCycle{std::chrono::milliseconds(1)};

// Fixed-cadence pacing for the poll and synthetic workers.
// Overruns are not caught up: a late cycle is followed by an immediate one, never a burst.
class CycleClock {
 public:
  using clock = std::chrono::steady_clock;

  explicit CycleClock(std::chrono::nanoseconds cycle) noexcept;

  [[nodiscard]] std::chrono::nanoseconds cycle() const noexcept { return cycle_; }
  [[nodiscard]] std::uint64_t tick() const noexcept { return tick_count_; }

  [[nodiscard]] bool should_fire_every(std::uint64_t every_n_ticks) const noexcept;

  // Time left in the cycle that started at `cycle_start`; zero on overrun.
  [[nodiscard]] std::chrono::nanoseconds remaining(clock::time_point cycle_start,
                                                   clock::time_point now) const noexcept;

  void advance() noexcept;

  [[nodiscard]] std::uint64_t overruns() const noexcept { return overruns_; }
  void note_overrun() noexcept { ++overruns_; }

 private:
  std::chrono::nanoseconds cycle_;
  std::uint64_t tick_count_{0};
  std::uint64_t overruns_{0};
};

// Zero for non-finite or non-positive input.
std::chrono::nanoseconds cycle_from_seconds(double seconds) noexcept;

[[nodiscard]] inline bool valid_cycle(const std::chrono::nanoseconds cycle) noexcept { return cycle >= kMinCycle; }

}  // namespace dl100_bridge::core
