#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

#include "model/record.hpp"
#include "model/status.hpp"

namespace dl100_bridge::aggregation {

// Readings accumulated since the last completed record.
struct PartialState {
  std::optional<model::Reading> distance{};
  std::optional<model::Reading> velocity{};

  // Arrival order of the channels currently held. A channel appears at most once;
  // re-observing a channel moves it to the back.
  std::array<model::Channel, 2> order{};
  std::size_t order_size{0};

  [[nodiscard]] bool empty() const noexcept { return order_size == 0; }

  // Complete iff distance arrived first and velocity after it.
  [[nodiscard]] bool complete() const noexcept {
    return order_size == 2 && order[0] == model::Channel::DISTANCE && order[1] == model::Channel::VELOCITY;
  }
};

class AggregationBuffer {
 public:
  AggregationBuffer() = default;

  AggregationBuffer(const AggregationBuffer&) = delete;
  AggregationBuffer& operator=(const AggregationBuffer&) = delete;

  model::Status observe(std::string_view name, std::int32_t value, std::uint64_t timestamp_ms);

  std::optional<model::Record> try_complete();

  // observe + try_complete under one lock. `completed` is reset on every call.
  model::Status accept(std::string_view name, std::int32_t value, std::uint64_t timestamp_ms,
                       std::optional<model::Record>& completed);

  [[nodiscard]] PartialState snapshot() const;
  void clear();

 private:
  model::Status observe_locked(std::string_view name, std::int32_t value, std::uint64_t timestamp_ms);
  std::optional<model::Record> try_complete_locked();

  mutable std::mutex mutex_;
  PartialState state_{};
};

}  // namespace dl100_bridge::aggregation
