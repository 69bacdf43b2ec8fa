#pragma once

#include <cstdio>

#include "model/health_score.hpp"
#include "model/metrics.hpp"

namespace device_agent::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const model::NormalizedMetrics& metrics, const model::HealthScore& score) const;

 private:
  std::FILE* out_;
};

}  // namespace device_agent::sinks
