#include "model/json.hpp"

#include <variant>

#include "core/timestamp.hpp"

namespace device_agent::model {
namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

}  // namespace

void to_json(nlohmann::json& out, const NormalizedMetrics& metrics) {
  nlohmann::json extras = nlohmann::json::object();
  for (const auto& [key, value] : metrics.extras) {
    std::visit([&extras, &key](const auto& v) { extras[key] = v; }, value);
  }

  nlohmann::json sources = nlohmann::json::object();
  for (const auto& [name, outcome] : metrics.sources) {
    sources[name] = to_string(outcome);
  }

  out = nlohmann::json{{"cpu_percent", optional_value(metrics.cpu_percent)},
                       {"memory_percent", optional_value(metrics.memory_percent)},
                       {"disk_percent", optional_value(metrics.disk_percent)},
                       {"uptime_seconds", optional_value(metrics.uptime_seconds)},
                       {"timestamp_ms", core::to_unix_ms(metrics.timestamp)},
                       {"platform", core::to_string(metrics.platform)},
                       {"extras", extras},
                       {"sources", sources}};
}

void to_json(nlohmann::json& out, const ContributingFactor& factor) {
  out = nlohmann::json{{"factor", factor.name}, {"penalty", factor.penalty}, {"reason", factor.reason}};
}

void to_json(nlohmann::json& out, const HealthScore& score) {
  out = nlohmann::json{{"score", score.score},
                       {"status", to_string(score.status)},
                       {"contributing_factors", score.contributing_factors},
                       {"recommendations", score.recommendations}};
}

}  // namespace device_agent::model
