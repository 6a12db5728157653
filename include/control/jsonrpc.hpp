#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace dl100_bridge::control {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

struct JsonRpcError {
  int code;
  std::string message;
};

// Thrown by parse_request for envelopes that are not JSON-RPC 2.0 requests.
class InvalidRequest : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace dl100_bridge::control
