#pragma once

#include <algorithm>
#include <cmath>
#include <optional>

namespace device_agent::core {

inline constexpr float clamp_percent(const float value) noexcept {
  return std::clamp(value, 0.0F, 100.0F);
}

// Non-finite input is reported as unknown rather than clamped into range.
inline std::optional<float> sanitize_percent(const double value) noexcept {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return clamp_percent(static_cast<float>(value));
}

}  // namespace device_agent::core
