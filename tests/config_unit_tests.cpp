#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/errors.hpp"

using device_agent::core::ConfigError;
using device_agent::core::ScoringPolicy;
using device_agent::core::ServiceConfig;
using device_agent::core::apply_environment_overrides;
using device_agent::core::load_service_config;
using device_agent::core::provider_enabled;
using device_agent::core::validate_scoring_policy;

namespace {

bool almost_equal(float a, float b, float eps = 1e-4F) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const char* name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

bool load_throws(const char* name, const std::string& content) {
  const auto path = write_config(name, content);
  bool threw = false;
  try {
    (void)load_service_config(path.string());
  } catch (const ConfigError&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_nested_keys_are_flattened() {
  const auto path = write_config("device_agent_nested.yaml",
                                 "# comment line\n"
                                 "platform:\n"
                                 "  override: embedded   # trailing comment\n"
                                 "metrics:\n"
                                 "  cache_ttl_ms: 1500\n"
                                 "  provider_timeout_ms: 250\n"
                                 "  worker_threads: 8\n"
                                 "  disk_path: \"/data\"\n"
                                 "providers:\n"
                                 "  thermal: false\n"
                                 "scoring:\n"
                                 "  memory:\n"
                                 "    warning_pct: 70\n"
                                 "    max_penalty: 40\n"
                                 "  unknown_penalty: 15\n"
                                 "  status:\n"
                                 "    healthy_min: 85\n"
                                 "actions:\n"
                                 "  allowed_services: a.service, b.service ,\n"
                                 "redis:\n"
                                 "  address: unix:///run/redis.sock\n");

  ServiceConfig config{};
  try {
    config = load_service_config(path.string());
  } catch (const std::exception& ex) {
    std::filesystem::remove(path);
    std::cerr << ex.what() << '\n';
    return fail("test_nested_keys_are_flattened", "load should succeed");
  }
  std::filesystem::remove(path);

  if (config.platform_override != std::optional<std::string>("embedded")) {
    return fail("test_nested_keys_are_flattened", "platform.override mismatch");
  }
  if (config.cache_ttl.count() != 1500 || config.provider_timeout.count() != 250 || config.worker_threads != 8U) {
    return fail("test_nested_keys_are_flattened", "metrics section mismatch");
  }
  if (config.disk_path != "/data") {
    return fail("test_nested_keys_are_flattened", "quoted value should be unquoted");
  }
  if (provider_enabled(config, "thermal") || !provider_enabled(config, "cpu")) {
    return fail("test_nested_keys_are_flattened", "provider toggles mismatch");
  }
  if (!almost_equal(config.scoring.memory.warning_pct, 70.0F) || !almost_equal(config.scoring.memory.max_penalty, 40.0F) ||
      !almost_equal(config.scoring.cpu.warning_pct, 80.0F) || !almost_equal(config.scoring.unknown_penalty, 15.0F) ||
      config.scoring.healthy_min != 85 || config.scoring.degraded_min != 70) {
    return fail("test_nested_keys_are_flattened", "scoring section mismatch");
  }
  if (config.allowed_services.size() != 2U || config.allowed_services[1] != "b.service") {
    return fail("test_nested_keys_are_flattened", "allow-list should be split and trimmed");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/run/redis.sock") {
    return fail("test_nested_keys_are_flattened", "unix redis address mismatch");
  }
  return 0;
}

int test_empty_quoted_values_are_values() {
  const auto path = write_config("device_agent_empty_values.yaml",
                                 "platform:\n"
                                 "  override: \"\"\n"
                                 "redis:\n"
                                 "  address: \"\"\n"
                                 "  key_prefix: edge\n");
  ServiceConfig config = load_service_config(path.string());
  std::filesystem::remove(path);

  if (config.platform_override != std::optional<std::string>("")) {
    return fail("test_empty_quoted_values_are_values", "empty override should be kept as an empty value");
  }
  if (config.redis.enabled || config.redis.key_prefix != "edge") {
    return fail("test_empty_quoted_values_are_values", "redis should stay disabled with sibling keys applied");
  }
  return 0;
}

int test_invalid_values_throw() {
  if (!load_throws("device_agent_bad_ttl.yaml", "metrics:\n  cache_ttl_ms: -1\n")) {
    return fail("test_invalid_values_throw", "negative ttl should throw");
  }
  if (!load_throws("device_agent_bad_timeout.yaml", "metrics:\n  provider_timeout_ms: 0\n")) {
    return fail("test_invalid_values_throw", "zero provider timeout should throw");
  }
  if (!load_throws("device_agent_bad_threads.yaml", "metrics:\n  worker_threads: 65\n")) {
    return fail("test_invalid_values_throw", "worker_threads above 64 should throw");
  }
  if (!load_throws("device_agent_bad_int.yaml", "metrics:\n  cache_ttl_ms: 10s\n")) {
    return fail("test_invalid_values_throw", "trailing garbage should throw");
  }
  if (!load_throws("device_agent_bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_invalid_values_throw", "bad redis port should throw");
  }
  if (!load_throws("device_agent_bad_float.yaml", "scoring:\n  cpu:\n    warning_pct: high\n")) {
    return fail("test_invalid_values_throw", "non-numeric threshold should throw");
  }
  if (!load_throws("device_agent_bad_warning.yaml", "scoring:\n  disk:\n    warning_pct: 100\n")) {
    return fail("test_invalid_values_throw", "warning_pct of 100 should throw");
  }
  if (!load_throws("device_agent_bad_status.yaml", "scoring:\n  status:\n    healthy_min: 60\n")) {
    return fail("test_invalid_values_throw", "healthy_min below degraded_min should throw");
  }

  bool missing_threw = false;
  try {
    (void)load_service_config("/nonexistent/device-agent.yaml");
  } catch (const ConfigError&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_invalid_values_throw", "missing file should throw");
  }
  return 0;
}

int test_environment_overrides_win() {
  ServiceConfig config{};
  config.platform_override = "desktop";

  setenv("DEVICE_AGENT_PLATFORM", "orangepi", 1);
  setenv("DEVICE_AGENT_CACHE_TTL_MS", "250", 1);
  apply_environment_overrides(config);

  if (config.platform_override != std::optional<std::string>("orangepi") || config.cache_ttl.count() != 250) {
    unsetenv("DEVICE_AGENT_PLATFORM");
    unsetenv("DEVICE_AGENT_CACHE_TTL_MS");
    return fail("test_environment_overrides_win", "environment should take precedence");
  }

  setenv("DEVICE_AGENT_CACHE_TTL_MS", "soon", 1);
  bool threw = false;
  try {
    apply_environment_overrides(config);
  } catch (const ConfigError&) {
    threw = true;
  }
  unsetenv("DEVICE_AGENT_PLATFORM");
  unsetenv("DEVICE_AGENT_CACHE_TTL_MS");

  if (!threw) {
    return fail("test_environment_overrides_win", "malformed ttl in the environment should throw");
  }
  return 0;
}

int test_default_scoring_policy_is_valid() {
  try {
    validate_scoring_policy(ScoringPolicy{});
  } catch (const ConfigError&) {
    return fail("test_default_scoring_policy_is_valid", "defaults should validate");
  }

  ScoringPolicy negative{};
  negative.unknown_penalty = -1.0F;
  bool threw = false;
  try {
    validate_scoring_policy(negative);
  } catch (const ConfigError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_default_scoring_policy_is_valid", "negative unknown penalty should throw");
  }
  return 0;
}

int test_non_finite_scoring_values_throw() {
  if (!load_throws("device_agent_nan_warning.yaml",
                   "scoring:\n"
                   "  cpu:\n"
                   "    warning_pct: nan\n")) {
    return fail("test_non_finite_scoring_values_throw", "NaN warning threshold should be rejected");
  }
  if (!load_throws("device_agent_inf_penalty.yaml",
                   "scoring:\n"
                   "  unknown_penalty: inf\n")) {
    return fail("test_non_finite_scoring_values_throw", "infinite penalty should be rejected");
  }

  ScoringPolicy policy{};
  policy.disk.max_penalty = std::nanf("");
  bool threw = false;
  try {
    validate_scoring_policy(policy);
  } catch (const ConfigError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_non_finite_scoring_values_throw", "NaN max penalty should throw");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_nested_keys_are_flattened(); rc != 0) {
    return rc;
  }
  if (int rc = test_empty_quoted_values_are_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_invalid_values_throw(); rc != 0) {
    return rc;
  }
  if (int rc = test_environment_overrides_win(); rc != 0) {
    return rc;
  }
  if (int rc = test_default_scoring_policy_is_valid(); rc != 0) {
    return rc;
  }
  if (int rc = test_non_finite_scoring_values_throw(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
