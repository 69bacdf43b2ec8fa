#pragma once

#include <iosfwd>

#include "api/methods.hpp"

namespace device_agent::api {

// Newline-delimited JSON-RPC 2.0: one request per input line, one response
// per line for every request that carries an id.
class Server {
 public:
  explicit Server(MethodTable methods);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

 private:
  MethodTable methods_;
};

}  // namespace device_agent::api
