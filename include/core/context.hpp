#pragma once

#include <memory>

#include "core/config.hpp"
#include "core/factory_registry.hpp"
#include "core/metrics_facade.hpp"
#include "core/platform.hpp"
#include "core/registry.hpp"

namespace device_agent::core {

// Everything a request handler needs, built once at startup and handed
// around explicitly.
class DeviceContext {
  struct ConstructionTag {
    explicit ConstructionTag() = default;
  };

 public:
  // Detects the platform, installs and validates its bindings, then seals the
  // registry. Throws ConfigError for a bad override and BootstrapError when a
  // required contract is left unbound.
  static std::unique_ptr<DeviceContext> bootstrap(const ServiceConfig& config, const PlatformDetector& detector,
                                                  const FactoryRegistry& factories);

  DeviceContext(ConstructionTag, ServiceConfig config, DetectedPlatform platform);

  DeviceContext(const DeviceContext&) = delete;
  DeviceContext& operator=(const DeviceContext&) = delete;

  [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }
  [[nodiscard]] const DetectedPlatform& platform() const noexcept { return platform_; }
  [[nodiscard]] const ServiceRegistry& registry() const noexcept { return registry_; }
  [[nodiscard]] MetricsFacade& metrics() noexcept { return *metrics_; }

 private:
  ServiceConfig config_;
  DetectedPlatform platform_;
  ServiceRegistry registry_;
  std::unique_ptr<MetricsFacade> metrics_;
};

}  // namespace device_agent::core
