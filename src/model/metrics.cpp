#include "model/metrics.hpp"

#include "model/health_score.hpp"

namespace device_agent::model {

const char* to_string(const ProviderOutcome outcome) noexcept {
  switch (outcome) {
    case ProviderOutcome::OK:
      return "ok";
    case ProviderOutcome::FAILED:
      return "failed";
    case ProviderOutcome::TIMEOUT:
      return "timeout";
    case ProviderOutcome::BUSY:
      return "busy";
  }
  return "failed";
}

const char* to_string(const HealthStatus status) noexcept {
  switch (status) {
    case HealthStatus::HEALTHY:
      return "healthy";
    case HealthStatus::DEGRADED:
      return "degraded";
    case HealthStatus::CRITICAL:
      return "critical";
    case HealthStatus::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

std::size_t NormalizedMetrics::unknown_core_fields() const noexcept {
  std::size_t unknown = 0;
  unknown += cpu_percent.has_value() ? 0U : 1U;
  unknown += memory_percent.has_value() ? 0U : 1U;
  unknown += disk_percent.has_value() ? 0U : 1U;
  unknown += uptime_seconds.has_value() ? 0U : 1U;
  return unknown;
}

}  // namespace device_agent::model
