#include "api/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "api/jsonrpc.hpp"

namespace device_agent::api {

Server::Server(MethodTable methods) : methods_(std::move(methods)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    nlohmann::json request;
    try {
      request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
      err << "[api] unparseable request: " << ex.what() << '\n';
      out << make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"}).dump() << '\n';
      out.flush();
      continue;
    }

    bool should_respond = true;
    try {
      const auto response = handle_request(request, should_respond);
      if (should_respond) {
        // Labels read from sysfs or command output may hold invalid UTF-8.
        out << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "[api] failed to process request: " << ex.what() << '\n';
      if (should_respond) {
        out << make_error_response(nullptr, JsonRpcError{.code = kInternalError, .message = "internal error"}).dump()
            << '\n';
        out.flush();
      }
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  nlohmann::json id = nullptr;
  // Echo a usable id even when the rest of the request is malformed.
  if (request.is_object()) {
    const auto raw_id = request.find("id");
    if (raw_id != request.end() && (raw_id->is_string() || raw_id->is_number_integer())) {
      id = *raw_id;
    }
  }

  try {
    const auto parsed = parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    const auto method = methods_.find(parsed.method);
    if (method == methods_.end()) {
      return make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "method not found"});
    }

    return make_result_response(id, method->second.handler(parsed.params));
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const CapabilityUnavailable& ex) {
    return make_error_response(id, JsonRpcError{.code = kCapabilityUnavailable, .message = ex.what()});
  } catch (const std::exception& ex) {
    std::cerr << "[api] internal error: " << ex.what() << '\n';
    return make_error_response(id, JsonRpcError{.code = kInternalError, .message = "internal error"});
  }
}

}  // namespace device_agent::api
