#include "core/factory_registry.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace device_agent::core {

void FactoryRegistry::add(const PlatformIdentity platform, PlatformBindings bindings) {
  const std::string key = to_string(platform);
  if (by_platform_.find(key) != by_platform_.end()) {
    throw std::logic_error("binding set already defined for platform " + key);
  }
  by_platform_.emplace(key, std::move(bindings));
}

bool FactoryRegistry::has(const PlatformIdentity platform) const {
  return by_platform_.find(to_string(platform)) != by_platform_.end();
}

const PlatformBindings& FactoryRegistry::select(const PlatformIdentity platform) const {
  const auto it = by_platform_.find(to_string(platform));
  if (it != by_platform_.end()) {
    return it->second;
  }

  const auto fallback = by_platform_.find(to_string(PlatformIdentity::GENERIC));
  if (fallback == by_platform_.end()) {
    throw BootstrapError(std::string("no binding set for platform ") + to_string(platform) +
                         " and no generic fallback");
  }

  std::cerr << "[registry] no binding set for " << to_string(platform) << ", using generic\n";
  return fallback->second;
}

}  // namespace device_agent::core
