#include "control/control_server.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "control/jsonrpc.hpp"

namespace dl100_bridge::control {

namespace {

class MethodNotFound : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void write_response(std::ostream& out, const std::optional<std::string>& response) {
  if (response.has_value()) {
    out << *response << '\n';
    out.flush();
  }
}

}  // namespace

nlohmann::json health_to_json(const model::BridgeHealth& health) {
  nlohmann::json out{{"heartbeat_ms", health.heartbeat_ms},
                     {"readings_observed", health.readings_observed},
                     {"records_completed", health.records_completed},
                     {"frames_sent", health.frames_sent},
                     {"frames_suppressed", health.frames_suppressed},
                     {"frames_dropped", health.frames_dropped},
                     {"unknown_attributes", health.unknown_attributes},
                     {"malformed_readings", health.malformed_readings},
                     {"poll_cycles", health.poll_cycles},
                     {"poll_timeouts", health.poll_timeouts},
                     {"gate_active", health.gate_active}};
  if (health.has_last_record) {
    out["last_record"] = {{"distance", health.last_distance}, {"velocity", health.last_velocity}};
  } else {
    out["last_record"] = nullptr;
  }
  return out;
}

ControlServer::ControlServer(core::Bridge& bridge) : bridge_(bridge) {}

std::optional<std::string> ControlServer::handle_line(const std::string& line) {
  if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::nullopt;
  }

  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error&) {
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"}).dump();
  }

  bool should_respond = true;
  const auto response = handle_request(request, should_respond);
  if (!should_respond) {
    return std::nullopt;
  }
  return response.dump();
}

void ControlServer::feed(const std::string_view chunk, std::ostream& out, std::ostream& err) {
  pending_.append(chunk.data(), chunk.size());

  std::size_t newline = pending_.find('\n');
  while (newline != std::string::npos && !stop_requested()) {
    const std::string line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    if (discarding_) {
      discarding_ = false;
    } else if (line.size() > kMaxLineBytes) {
      reject_oversized_line(out, err);
    } else {
      write_response(out, respond(line, err));
    }
    newline = pending_.find('\n');
  }

  if (newline == std::string::npos && pending_.size() > kMaxLineBytes) {
    pending_.clear();
    if (!discarding_) {
      reject_oversized_line(out, err);
      discarding_ = true;
    }
  }
}

void ControlServer::finish(std::ostream& out, std::ostream& err) {
  if (!discarding_ && !stop_requested() && !pending_.empty()) {
    write_response(out, respond(pending_, err));
  }
  pending_.clear();
  discarding_ = false;
}

int ControlServer::run(std::istream& in, std::ostream& out, std::ostream& err) {
  constexpr std::size_t kChunkBytes = 512;
  std::string chunk;
  char c = 0;
  while (!stop_requested() && in.get(c)) {
    chunk.push_back(c);
    if (c == '\n' || chunk.size() >= kChunkBytes) {
      feed(chunk, out, err);
      chunk.clear();
    }
  }
  if (!stop_requested()) {
    feed(chunk, out, err);
    finish(out, err);
  }
  return 0;
}

std::optional<std::string> ControlServer::respond(const std::string& line, std::ostream& err) {
  try {
    return handle_line(line);
  } catch (const std::exception& ex) {
    err << "[control] failed to process request: " << ex.what() << '\n';
    return make_error_response(nullptr, JsonRpcError{.code = kInternalError, .message = "internal error"}).dump();
  }
}

void ControlServer::reject_oversized_line(std::ostream& out, std::ostream& err) {
  err << "[control] request line over " << kMaxLineBytes << " bytes dropped\n";
  write_response(out, make_error_response(nullptr, JsonRpcError{.code = kInvalidRequest,
                                                               .message = "request line too long"})
                          .dump());
}

nlohmann::json ControlServer::handle_request(const nlohmann::json& request, bool& should_respond) {
  nlohmann::json id = nullptr;
  if (request.is_object()) {
    if (const auto it = request.find("id"); it != request.end() && (it->is_string() || it->is_number_integer())) {
      id = *it;
    }
  }

  try {
    const auto parsed = parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }
    return make_result_response(id, dispatch(parsed.method, parsed.params));
  } catch (const InvalidRequest& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  } catch (const MethodNotFound&) {
    return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "method not found"});
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  }
}

nlohmann::json ControlServer::dispatch(const std::string& method, const nlohmann::json& params) {
  if (method == "initialize") {
    return handle_initialize();
  }
  if (method == "gate/toggle") {
    const bool active = bridge_.toggle_publishing();
    std::cerr << "[control] publishing " << (active ? "activated" : "deactivated") << '\n';
    return nlohmann::json{{"active", active}};
  }
  if (method == "gate/status") {
    return nlohmann::json{{"active", bridge_.publishing_active()}};
  }
  if (method == "gate/set") {
    return handle_gate_set(params);
  }
  if (method == "bridge/stats") {
    return handle_stats();
  }
  if (method == "bridge/stop") {
    stop_requested_.store(true, std::memory_order_release);
    std::cerr << "[control] stop requested\n";
    return nlohmann::json{{"stopping", true}};
  }
  throw MethodNotFound(method);
}

nlohmann::json ControlServer::handle_initialize() const {
  return nlohmann::json{{"serverInfo", {{"name", "dl100-bridge"}, {"version", "0.1.0"}}},
                        {"capabilities",
                         {{"methods", {"gate/toggle", "gate/status", "gate/set", "bridge/stats", "bridge/stop"}}}}};
}

nlohmann::json ControlServer::handle_gate_set(const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }
  const auto active_it = params.find("active");
  if (active_it == params.end() || !active_it->is_boolean()) {
    throw std::invalid_argument("active must be a boolean");
  }

  const bool active = active_it->get<bool>();
  bridge_.set_publishing(active);
  std::cerr << "[control] publishing " << (active ? "activated" : "deactivated") << '\n';
  return nlohmann::json{{"active", active}};
}

nlohmann::json ControlServer::handle_stats() const {
  nlohmann::json stats = health_to_json(bridge_.health());
  stats["mode"] = std::string(model::mode_name(bridge_.mode()));
  stats["running"] = bridge_.running();
  return stats;
}

}  // namespace dl100_bridge::control
