#include "sinks/stdout_debug.hpp"

#include <limits>
#include <optional>

namespace device_agent::sinks {
namespace {

double or_nan(const std::optional<float>& value) {
  return value.has_value() ? static_cast<double>(*value) : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace

void StdoutDebugSink::publish(const model::NormalizedMetrics& metrics, const model::HealthScore& score) const {
  std::fprintf(out_, "[refresh] platform=%s cpu_pct=%.2f memory_pct=%.2f disk_pct=%.2f uptime_s=%lld score=%d status=%s\n",
               core::to_string(metrics.platform), or_nan(metrics.cpu_percent), or_nan(metrics.memory_percent),
               or_nan(metrics.disk_percent),
               metrics.uptime_seconds.has_value() ? static_cast<long long>(*metrics.uptime_seconds) : -1LL,
               score.score, model::to_string(score.status));
  std::fflush(out_);
}

}  // namespace device_agent::sinks
