#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/platform.hpp"
#include "core/registry.hpp"

namespace device_agent::core {

struct BindingContext {
  const ServiceConfig& config;
  const PlatformProbe& probe;
};

using BindingInstaller = std::function<void(ServiceRegistry&, const BindingContext&)>;

struct PlatformBindings {
  BindingInstaller install{};
  // Contracts that must be bound before the first request is served.
  std::vector<std::string> required{};
};

// Binding sets keyed by platform name. A platform without its own set gets
// the generic one.
class FactoryRegistry {
 public:
  void add(PlatformIdentity platform, PlatformBindings bindings);

  [[nodiscard]] bool has(PlatformIdentity platform) const;

  // Throws BootstrapError when neither the platform nor generic has a set.
  [[nodiscard]] const PlatformBindings& select(PlatformIdentity platform) const;

 private:
  std::map<std::string, PlatformBindings> by_platform_{};
};

}  // namespace device_agent::core
