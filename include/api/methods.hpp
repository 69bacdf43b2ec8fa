#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "core/context.hpp"

namespace device_agent::api {

// Thrown by a handler whose capability has no binding on this platform.
class CapabilityUnavailable : public std::runtime_error {
 public:
  explicit CapabilityUnavailable(const std::string& contract)
      : std::runtime_error("capability unavailable: " + contract), contract_(contract) {}

  [[nodiscard]] const std::string& contract() const noexcept { return contract_; }

 private:
  std::string contract_;
};

struct Method {
  std::string name;
  std::string description;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using MethodTable = std::map<std::string, Method>;

// The context must outlive the returned table.
MethodTable build_method_table(core::DeviceContext& context);

}  // namespace device_agent::api
