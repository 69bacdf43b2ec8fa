#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace device_agent::api {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidParams = -32602;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;
// The contract exists but has no binding on this platform.
constexpr int kCapabilityUnavailable = -32004;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace device_agent::api
