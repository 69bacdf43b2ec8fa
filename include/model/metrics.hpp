#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "core/platform.hpp"

namespace device_agent::model {

// Provider-specific bag of fields produced by one provider invocation.
struct RawMetricSample {
  std::map<std::string, double> values{};
  std::map<std::string, std::string> labels{};

  void set(const std::string& key, const double value) { values[key] = value; }
  void label(const std::string& key, std::string value) { labels[key] = std::move(value); }
};

enum class ProviderOutcome : std::uint8_t {
  OK = 0,
  FAILED = 1,
  TIMEOUT = 2,
  BUSY = 3,
};

const char* to_string(ProviderOutcome outcome) noexcept;

using ExtraValue = std::variant<double, std::string>;

// Unknown values are std::nullopt; no field is ever filled with a placeholder number.
struct NormalizedMetrics {
  std::optional<float> cpu_percent{};
  std::optional<float> memory_percent{};
  std::optional<float> disk_percent{};
  std::optional<std::uint64_t> uptime_seconds{};
  std::chrono::system_clock::time_point timestamp{};
  core::PlatformIdentity platform{core::PlatformIdentity::GENERIC};
  std::map<std::string, ExtraValue> extras{};
  std::map<std::string, ProviderOutcome> sources{};

  [[nodiscard]] std::size_t unknown_core_fields() const noexcept;
};

struct CacheEntry {
  NormalizedMetrics metrics{};
  std::chrono::steady_clock::time_point captured_at{};
};

}  // namespace device_agent::model
