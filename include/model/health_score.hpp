#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace device_agent::model {

enum class HealthStatus : std::uint8_t {
  HEALTHY = 0,
  DEGRADED = 1,
  CRITICAL = 2,
  UNKNOWN = 3,
};

const char* to_string(HealthStatus status) noexcept;

struct ContributingFactor {
  std::string name{};
  float penalty{0.0F};
  std::string reason{};
};

struct HealthScore {
  int score{0};
  HealthStatus status{HealthStatus::UNKNOWN};
  std::vector<ContributingFactor> contributing_factors{};
  std::vector<std::string> recommendations{};
};

}  // namespace device_agent::model
