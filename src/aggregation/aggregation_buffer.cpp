#include "aggregation/aggregation_buffer.hpp"

#include <string>
#include <utility>

namespace dl100_bridge::aggregation {
namespace {

void move_to_back(PartialState& state, const model::Channel channel) noexcept {
  std::size_t kept = 0;
  for (std::size_t i = 0; i < state.order_size; ++i) {
    if (state.order[i] != channel) {
      state.order[kept++] = state.order[i];
    }
  }
  state.order[kept] = channel;
  state.order_size = kept + 1;
}

}  // namespace

model::Status AggregationBuffer::observe(const std::string_view name, const std::int32_t value,
                                         const std::uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  return observe_locked(name, value, timestamp_ms);
}

std::optional<model::Record> AggregationBuffer::try_complete() {
  std::lock_guard<std::mutex> lock(mutex_);
  return try_complete_locked();
}

model::Status AggregationBuffer::accept(const std::string_view name, const std::int32_t value,
                                        const std::uint64_t timestamp_ms,
                                        std::optional<model::Record>& completed) {
  std::lock_guard<std::mutex> lock(mutex_);
  completed.reset();
  const model::Status status = observe_locked(name, value, timestamp_ms);
  if (status != model::Status::OK) {
    return status;
  }
  completed = try_complete_locked();
  return status;
}

PartialState AggregationBuffer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void AggregationBuffer::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = PartialState{};
}

model::Status AggregationBuffer::observe_locked(const std::string_view name, const std::int32_t value,
                                                const std::uint64_t timestamp_ms) {
  const auto channel = model::channel_from_name(name);
  if (!channel.has_value()) {
    return model::Status::UNKNOWN_ATTRIBUTE;
  }

  model::Reading reading{std::string(name), value, timestamp_ms};
  if (*channel == model::Channel::DISTANCE) {
    state_.distance = std::move(reading);
  } else {
    state_.velocity = std::move(reading);
  }
  move_to_back(state_, *channel);
  return model::Status::OK;
}

std::optional<model::Record> AggregationBuffer::try_complete_locked() {
  if (!state_.complete()) {
    return std::nullopt;
  }

  const model::Record record{state_.distance->timestamp_ms, state_.distance->value, state_.velocity->value};
  state_ = PartialState{};
  return record;
}

}  // namespace dl100_bridge::aggregation
