#include "risk/health_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "core/math.hpp"

namespace device_agent::risk {
namespace {

std::string format_pct(const float value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(1);
  out << value << '%';
  return out.str();
}

float threshold_penalty(const float value, const core::FactorPolicy& factor) noexcept {
  if (value <= factor.warning_pct) {
    return 0.0F;
  }
  const float span = 100.0F - factor.warning_pct;
  const float over = core::clamp_percent(value) - factor.warning_pct;
  return std::min(factor.max_penalty, factor.max_penalty * (over / span));
}

struct PercentFactor {
  const char* name;
  const char* label;
  const char* recommendation;
  const std::optional<float>& value;
  const core::FactorPolicy& policy;
};

}  // namespace

HealthScorer::HealthScorer(core::ScoringPolicy policy) : policy_(std::move(policy)) {}

model::HealthScore HealthScorer::score(const model::NormalizedMetrics& metrics) const {
  model::HealthScore result{};
  float total_penalty = 0.0F;

  const PercentFactor percent_factors[] = {
      {"cpu", "CPU usage", "Consider reducing CPU load or scaling resources", metrics.cpu_percent, policy_.cpu},
      {"memory", "Memory usage", "Memory usage is high - consider freeing up memory or adding more RAM",
       metrics.memory_percent, policy_.memory},
      {"disk", "Disk usage", "Disk space is running low - cleanup or expand storage", metrics.disk_percent,
       policy_.disk},
  };

  for (const auto& factor : percent_factors) {
    if (!factor.value.has_value()) {
      if (policy_.unknown_penalty > 0.0F) {
        result.contributing_factors.push_back(
            {factor.name, policy_.unknown_penalty, std::string(factor.label) + " unavailable"});
        total_penalty += policy_.unknown_penalty;
      }
      result.recommendations.push_back(std::string("Check the ") + factor.name + " metrics provider");
      continue;
    }

    const float penalty = threshold_penalty(*factor.value, factor.policy);
    if (penalty > 0.0F) {
      result.contributing_factors.push_back(
          {factor.name, penalty,
           std::string(factor.label) + " " + format_pct(*factor.value) + " exceeds warning threshold " +
               format_pct(factor.policy.warning_pct)});
      result.recommendations.emplace_back(factor.recommendation);
      total_penalty += penalty;
    }
  }

  float bonus = 0.0F;
  if (metrics.uptime_seconds.has_value()) {
    if (*metrics.uptime_seconds >= policy_.uptime_bonus_after_s) {
      bonus = policy_.uptime_bonus;
    }
  } else {
    result.recommendations.emplace_back("Check the uptime metrics provider");
  }

  // The bonus may offset penalties but never lifts the score above 100.
  const float raw_score = std::min(100.0F, 100.0F - total_penalty + bonus);
  result.score = static_cast<int>(std::lround(std::clamp(raw_score, 0.0F, 100.0F)));

  if (metrics.unknown_core_fields() > 2U) {
    result.status = model::HealthStatus::UNKNOWN;
  } else if (result.score >= policy_.healthy_min) {
    result.status = model::HealthStatus::HEALTHY;
  } else if (result.score >= policy_.degraded_min) {
    result.status = model::HealthStatus::DEGRADED;
  } else {
    result.status = model::HealthStatus::CRITICAL;
  }

  return result;
}

}  // namespace device_agent::risk
