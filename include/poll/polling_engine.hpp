#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/stop_signal.hpp"
#include "model/status.hpp"
#include "poll/attribute_map.hpp"

namespace dl100_bridge::poll {

// Device side of the poll loop. The EtherNet/IP client lives behind this seam;
// reconnecting after a failed read is the reader's job.
class AttributeReader {
 public:
  virtual ~AttributeReader() = default;

  virtual bool available() const = 0;
  virtual std::string endpoint() const = 0;

  // Fills `values` and returns OK, or returns POLL_TIMEOUT when the device did not
  // answer within `timeout`.
  virtual model::Status read(const AttributeId& attribute, std::chrono::milliseconds timeout,
                             std::vector<std::int32_t>& values) = 0;
};

// Used when no EtherNet/IP driver is linked in: every read times out.
std::unique_ptr<AttributeReader> make_unavailable_reader(std::string host, std::uint16_t port);

struct PollOptions {
  std::chrono::nanoseconds cycle{std::chrono::nanoseconds(33'333'333)};
  std::chrono::milliseconds timeout{500};
};

struct PollStats {
  std::uint64_t cycles{0};
  std::uint64_t reads{0};
  std::uint64_t timeouts{0};
  std::uint64_t callback_errors{0};
};

using PollCallback = std::function<void(const AttributeId&, const std::vector<std::int32_t>&)>;

// Polls a fixed attribute list once per cycle on its own worker thread and hands every
// successful read to the callback. A timed-out read skips that attribute for the cycle.
class PollingEngine {
 public:
  explicit PollingEngine(std::unique_ptr<AttributeReader> reader);
  ~PollingEngine();

  PollingEngine(const PollingEngine&) = delete;
  PollingEngine& operator=(const PollingEngine&) = delete;

  model::Status subscribe(std::vector<AttributeId> attributes, PollOptions options, PollCallback callback);

  // Returns once the worker has left its loop; at most one cycle plus one read timeout.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
  [[nodiscard]] PollStats stats() const noexcept;

 private:
  void run(std::vector<AttributeId> attributes, PollOptions options, PollCallback callback);
  void poll_once(const std::vector<AttributeId>& attributes, const PollOptions& options,
                 const PollCallback& callback, std::vector<std::int32_t>& values);

  std::unique_ptr<AttributeReader> reader_;
  core::StopSignal stop_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  bool subscribed_{false};
  bool reader_was_ok_{true};
  std::uint64_t timeouts_since_ok_{0};

  std::atomic<std::uint64_t> cycles_{0};
  std::atomic<std::uint64_t> reads_{0};
  std::atomic<std::uint64_t> timeouts_{0};
  std::atomic<std::uint64_t> callback_errors_{0};
};

}  // namespace dl100_bridge::poll
