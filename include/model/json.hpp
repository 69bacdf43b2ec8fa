#pragma once

#include <nlohmann/json.hpp>

#include "model/health_score.hpp"
#include "model/metrics.hpp"

namespace device_agent::model {

void to_json(nlohmann::json& out, const NormalizedMetrics& metrics);
void to_json(nlohmann::json& out, const ContributingFactor& factor);
void to_json(nlohmann::json& out, const HealthScore& score);

}  // namespace device_agent::model
