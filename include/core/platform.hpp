#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace device_agent::core {

enum class PlatformIdentity : std::uint8_t {
  DESKTOP = 0,
  EMBEDDED = 1,
  GENERIC = 2,
};

const char* to_string(PlatformIdentity platform) noexcept;

// Accepts the canonical names and the legacy deployment aliases
// (macos, orangepi, linux), case-insensitive.
std::optional<PlatformIdentity> parse_platform(std::string_view value);

struct PlatformProbe {
  std::string os_name{};
  std::string machine{};
  std::string device_tree_model{};
  std::string chassis_type{};
  bool appliance_marker{false};
};

struct DetectorPaths {
  std::string device_tree_model{"/proc/device-tree/model"};
  std::string chassis_type{"/sys/class/dmi/id/chassis_type"};
  std::string appliance_marker{"/etc/device-agent/appliance"};
};

struct DetectedPlatform {
  PlatformIdentity identity{PlatformIdentity::GENERIC};
  PlatformProbe probe{};
  bool overridden{false};
};

class PlatformDetector {
 public:
  explicit PlatformDetector(DetectorPaths paths = {});

  // Throws ConfigError when the override is set but not recognized.
  [[nodiscard]] PlatformIdentity detect(const std::optional<std::string>& override_value) const;

  // Probes the host once; the identity is either the override or the
  // classification of that same probe.
  [[nodiscard]] DetectedPlatform detect_with_evidence(const std::optional<std::string>& override_value) const;

  [[nodiscard]] PlatformProbe probe() const;

  [[nodiscard]] static PlatformIdentity classify(const PlatformProbe& probe);

 private:
  DetectorPaths paths_;
};

}  // namespace device_agent::core
