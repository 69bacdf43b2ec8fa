#include "api/jsonrpc.hpp"

#include <stdexcept>

namespace device_agent::api {

namespace {

void validate_id(const nlohmann::json& id) {
  if (id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned()) {
    return;
  }
  throw std::invalid_argument("JSON-RPC id must be string, integer, or null");
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw std::invalid_argument("request must be a JSON object");
  }

  const auto version = request.find("jsonrpc");
  if (version == request.end() || !version->is_string() || *version != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  const auto method = request.find("method");
  if (method == request.end() || !method->is_string()) {
    throw std::invalid_argument("method must be a string");
  }

  JsonRpcRequest parsed{.method = method->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  if (const auto params = request.find("params"); params != request.end()) {
    if (!params->is_object()) {
      throw std::invalid_argument("params must be an object");
    }
    parsed.params = *params;
  }

  if (const auto id = request.find("id"); id != request.end()) {
    validate_id(*id);
    parsed.id = *id;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace device_agent::api
