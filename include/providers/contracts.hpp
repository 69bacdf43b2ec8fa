#pragma once

#include <string>
#include <vector>

#include "core/registry.hpp"
#include "providers/camera.hpp"
#include "providers/health.hpp"
#include "providers/screenshot.hpp"
#include "providers/services.hpp"

namespace device_agent::providers {

inline constexpr core::Contract<HealthProvider> kCpuHealth{"health.cpu"};
inline constexpr core::Contract<HealthProvider> kMemoryHealth{"health.memory"};
inline constexpr core::Contract<HealthProvider> kDiskHealth{"health.disk"};
inline constexpr core::Contract<HealthProvider> kUptimeHealth{"health.uptime"};
inline constexpr core::Contract<HealthProvider> kLoadHealth{"health.load"};
inline constexpr core::Contract<HealthProvider> kNetworkHealth{"health.network"};
inline constexpr core::Contract<HealthProvider> kThermalHealth{"health.thermal"};
inline constexpr core::Contract<HealthProvider> kDeviceHealth{"health.device"};

inline constexpr core::Contract<CameraProvider> kCamera{"camera"};
inline constexpr core::Contract<ScreenshotProvider> kScreenshot{"screenshot"};
inline constexpr core::Contract<PlayerProvider> kPlayer{"player"};
inline constexpr core::Contract<ActionProvider> kActions{"actions"};

// Every metrics contributor the facade may poll, in merge order.
inline std::vector<core::Contract<HealthProvider>> health_contracts() {
  return {kCpuHealth,  kMemoryHealth,  kDiskHealth,  kUptimeHealth,
          kLoadHealth, kNetworkHealth, kThermalHealth, kDeviceHealth};
}

inline std::vector<std::string> baseline_contracts() {
  return {kCpuHealth.name, kMemoryHealth.name, kDiskHealth.name, kUptimeHealth.name};
}

// "health.cpu" -> "cpu", the key used under providers.* in the config file.
inline std::string provider_key(const core::Contract<HealthProvider>& contract) {
  const std::string name = contract.name;
  const auto dot = name.find('.');
  return dot == std::string::npos ? name : name.substr(dot + 1);
}

}  // namespace device_agent::providers
