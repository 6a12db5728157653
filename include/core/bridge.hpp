#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <vector>

#include "aggregation/aggregation_buffer.hpp"
#include "codec/frame_codec.hpp"
#include "core/activation_gate.hpp"
#include "core/stop_signal.hpp"
#include "model/bridge_health.hpp"
#include "model/record.hpp"
#include "model/status.hpp"
#include "poll/attribute_map.hpp"
#include "poll/polling_engine.hpp"
#include "sinks/publish_channel.hpp"
#include "sinks/stdout_debug.hpp"

namespace dl100_bridge::core {

struct BridgeOptions {
  bool start_active{true};
  bool verbose{false};
  // Destination of the verbose record echo.
  std::FILE* echo_stream{stdout};
  // Unknown attributes are logged on the first occurrence and then every N-th.
  std::uint64_t unknown_attribute_log_every{100};
};

struct SyntheticOptions {
  double cycle_seconds{1.0 / 30.0};
  bool inject_zero{false};
  std::uint64_t zero_every{50};
  std::uint32_t seed{0};
};

// Glues the poll worker (or the synthetic worker) to the publish channel:
// readings -> aggregation -> frame -> activation gate -> channel.
class Bridge {
 public:
  Bridge(BridgeOptions options, std::unique_ptr<sinks::PublishChannel> channel);
  ~Bridge();

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;

  // Starts the poll worker. Only one worker per Bridge, and never after stop().
  model::Status start(std::unique_ptr<poll::AttributeReader> reader, poll::PollOptions options,
                      model::PublishMode mode);
  model::Status start_synthetic(SyntheticOptions options);

  // Idempotent. Joins the worker, then closes the channel exactly once.
  void stop();

  // Poll callback. Never throws; bad input is counted and dropped.
  void observe(const poll::AttributeId& attribute, const std::vector<std::int32_t>& values);

  // encode -> gate -> send. Returns true when the frame reached the channel.
  bool publish(const model::Record& record);
  bool publish(const model::SingleRecord& record);

  bool toggle_publishing() noexcept;
  void set_publishing(bool active) noexcept;
  [[nodiscard]] bool publishing_active() const noexcept;

  [[nodiscard]] model::PublishMode mode() const noexcept { return mode_; }
  [[nodiscard]] bool running() const noexcept;
  [[nodiscard]] model::BridgeHealth health() const;
  [[nodiscard]] aggregation::PartialState pending() const { return buffer_.snapshot(); }

 private:
  void observe_multi(model::Channel channel, std::int32_t value, std::uint64_t timestamp_ms);
  void observe_single(model::Channel channel, std::int32_t value, std::uint64_t timestamp_ms);
  bool send_frame(const codec::Frame& frame);
  void note_unknown_attribute(const poll::AttributeId& attribute);
  void run_synthetic(SyntheticOptions options);

  BridgeOptions options_;
  std::unique_ptr<sinks::PublishChannel> channel_;
  sinks::StdoutDebugSink stdout_sink_{};
  aggregation::AggregationBuffer buffer_{};
  ActivationGate gate_;
  model::PublishMode mode_{model::PublishMode::MULTI};

  std::unique_ptr<poll::PollingEngine> engine_{};
  StopSignal synthetic_stop_{};
  std::thread synthetic_worker_{};
  std::atomic<bool> synthetic_running_{false};
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  std::atomic<std::uint64_t> readings_observed_{0};
  std::atomic<std::uint64_t> records_completed_{0};
  std::atomic<std::uint64_t> frames_sent_{0};
  std::atomic<std::uint64_t> frames_suppressed_{0};
  std::atomic<std::uint64_t> frames_dropped_{0};
  std::atomic<std::uint64_t> unknown_attributes_{0};
  std::atomic<std::uint64_t> malformed_readings_{0};
  std::atomic<bool> has_last_record_{false};
  std::atomic<std::int32_t> last_distance_{0};
  std::atomic<std::int32_t> last_velocity_{0};
};

}  // namespace dl100_bridge::core
