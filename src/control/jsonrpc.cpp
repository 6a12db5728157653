#include "control/jsonrpc.hpp"

namespace dl100_bridge::control {
namespace {

const nlohmann::json* find_member(const nlohmann::json& object, const char* name) {
  const auto it = object.find(name);
  return it == object.end() ? nullptr : &*it;
}

nlohmann::json envelope(const nlohmann::json& id) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}};
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequest("request must be a JSON object");
  }

  const auto* version = find_member(request, "jsonrpc");
  if (version == nullptr || !version->is_string() || version->get<std::string>() != kJsonRpcVersion) {
    throw InvalidRequest("jsonrpc must be \"2.0\"");
  }

  const auto* method = find_member(request, "method");
  if (method == nullptr || !method->is_string() || method->get<std::string>().empty()) {
    throw InvalidRequest("method must be a non-empty string");
  }

  JsonRpcRequest parsed{.method = method->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  // Control methods take named parameters only.
  if (const auto* params = find_member(request, "params"); params != nullptr && !params->is_null()) {
    if (!params->is_object()) {
      throw InvalidRequest("params must be an object");
    }
    parsed.params = *params;
  }

  if (const auto* id = find_member(request, "id"); id != nullptr) {
    if (!id->is_null() && !id->is_string() && !id->is_number_integer()) {
      throw InvalidRequest("id must be a string, an integer or null");
    }
    parsed.id = *id;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  auto response = envelope(id);
  response["result"] = result;
  return response;
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  auto response = envelope(id);
  response["error"] = nlohmann::json{{"code", error.code}, {"message", error.message}};
  return response;
}

}  // namespace dl100_bridge::control
