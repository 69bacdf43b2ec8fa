#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace device_agent::core {

struct FactorPolicy {
  float warning_pct{80.0F};
  float max_penalty{30.0F};
};

struct ScoringPolicy {
  FactorPolicy cpu{80.0F, 30.0F};
  FactorPolicy memory{80.0F, 30.0F};
  FactorPolicy disk{85.0F, 30.0F};
  float unknown_penalty{10.0F};
  float uptime_bonus{0.0F};
  std::uint64_t uptime_bonus_after_s{86400};
  int healthy_min{90};
  int degraded_min{70};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"device"};
  bool enabled{false};
};

struct ServiceConfig {
  std::optional<std::string> platform_override{};
  std::chrono::milliseconds cache_ttl{5000};
  std::chrono::milliseconds provider_timeout{2000};
  std::chrono::milliseconds cpu_sample_window{200};
  std::size_t worker_threads{4};
  std::string disk_path{"/"};
  std::string player_service{"slideshow-player.service"};
  std::string screenshot_dir{"/tmp/screenshots"};
  std::string screenshot_command{"scrot"};
  std::vector<std::string> allowed_services{};
  bool stdout_debug{false};
  RedisConfig redis{};
  ScoringPolicy scoring{};
  std::unordered_map<std::string, bool> provider_enabled{};
};

ServiceConfig load_service_config(const std::string& path);

// DEVICE_AGENT_PLATFORM and DEVICE_AGENT_CACHE_TTL_MS take precedence over the file.
void apply_environment_overrides(ServiceConfig& config);

void validate_scoring_policy(const ScoringPolicy& policy);

[[nodiscard]] bool provider_enabled(const ServiceConfig& config, const std::string& name);

}  // namespace device_agent::core
