#pragma once

#include <cstdint>
#include <type_traits>

namespace dl100_bridge::model {

// Counters snapshot taken by the control context and handed to the health sinks.
struct BridgeHealth {
  std::uint64_t heartbeat_ms;

  std::uint64_t readings_observed;
  std::uint64_t records_completed;
  std::uint64_t frames_sent;
  std::uint64_t frames_suppressed;
  std::uint64_t frames_dropped;
  std::uint64_t unknown_attributes;
  std::uint64_t malformed_readings;
  std::uint64_t poll_cycles;
  std::uint64_t poll_timeouts;

  bool gate_active;

  // Last record handed to the publish channel.
  bool has_last_record;
  std::int32_t last_distance;
  std::int32_t last_velocity;
};

static_assert(std::is_standard_layout_v<BridgeHealth>, "BridgeHealth must be standard layout");
static_assert(std::is_trivial_v<BridgeHealth>, "BridgeHealth must be trivial");

}  // namespace dl100_bridge::model
