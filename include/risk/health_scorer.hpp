#pragma once

#include "core/config.hpp"
#include "model/health_score.hpp"
#include "model/metrics.hpp"

namespace device_agent::risk {

// Pure function of a metrics snapshot. Factors are evaluated in a fixed order
// (cpu, memory, disk, uptime) and only ever lower the score below 100.
class HealthScorer {
 public:
  explicit HealthScorer(core::ScoringPolicy policy = {});

  [[nodiscard]] model::HealthScore score(const model::NormalizedMetrics& metrics) const;

  [[nodiscard]] const core::ScoringPolicy& policy() const noexcept { return policy_; }

 private:
  core::ScoringPolicy policy_;
};

}  // namespace device_agent::risk
