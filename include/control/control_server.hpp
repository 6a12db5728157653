#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/bridge.hpp"

namespace dl100_bridge::control {

// Line-delimited JSON-RPC 2.0 control surface for a running Bridge.
//   gate/toggle, gate/status, gate/set {active}, bridge/stats, bridge/stop
class ControlServer {
 public:
  // Longer request lines are dropped with an invalid-request reply.
  static constexpr std::size_t kMaxLineBytes = 64 * 1024;

  explicit ControlServer(core::Bridge& bridge);

  // One request line in, one response line out. Notifications and blank lines produce nothing.
  std::optional<std::string> handle_line(const std::string& line);

  // Appends raw input and answers every complete line on `out`. Stops consuming lines
  // once bridge/stop was handled.
  void feed(std::string_view chunk, std::ostream& out, std::ostream& err);

  // End of input: buffered text without a trailing newline is served as a last line.
  void finish(std::ostream& out, std::ostream& err);

  // Serves until EOF or until bridge/stop was handled.
  int run(std::istream& in, std::ostream& out, std::ostream& err);

  // Set by bridge/stop. The owner performs the actual shutdown.
  [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(std::memory_order_acquire); }

 private:
  std::optional<std::string> respond(const std::string& line, std::ostream& err);
  void reject_oversized_line(std::ostream& out, std::ostream& err);
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond);
  nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
  nlohmann::json handle_initialize() const;
  nlohmann::json handle_gate_set(const nlohmann::json& params);
  nlohmann::json handle_stats() const;

  core::Bridge& bridge_;
  std::atomic<bool> stop_requested_{false};
  std::string pending_{};
  // Set while the rest of an oversized line is being skipped.
  bool discarding_{false};
};

nlohmann::json health_to_json(const model::BridgeHealth& health);

}  // namespace dl100_bridge::control
