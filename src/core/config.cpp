#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace device_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw ConfigError(key + " must be an integer");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(key + " must be an integer");
  }
}

float parse_float(const std::string& key, const std::string& value) {
  try {
    return std::stof(value);
  } catch (const std::logic_error&) {
    throw ConfigError(key + " must be a number");
  }
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("redis.address", value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw ConfigError("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

bool apply_factor_key(FactorPolicy& factor, const std::string& key, const std::string& field, const std::string& value) {
  if (field == "warning_pct") {
    factor.warning_pct = parse_float(key, value);
    return true;
  }
  if (field == "max_penalty") {
    factor.max_penalty = parse_float(key, value);
    return true;
  }
  return false;
}

void apply_scoring_key(ScoringPolicy& scoring, const std::string& key, const std::string& value) {
  const std::string field = key.substr(std::string("scoring.").size());

  if (field.rfind("cpu.", 0) == 0) {
    apply_factor_key(scoring.cpu, key, field.substr(4), value);
    return;
  }
  if (field.rfind("memory.", 0) == 0) {
    apply_factor_key(scoring.memory, key, field.substr(7), value);
    return;
  }
  if (field.rfind("disk.", 0) == 0) {
    apply_factor_key(scoring.disk, key, field.substr(5), value);
    return;
  }

  if (field == "unknown_penalty") {
    scoring.unknown_penalty = parse_float(key, value);
  } else if (field == "uptime.bonus") {
    scoring.uptime_bonus = parse_float(key, value);
  } else if (field == "uptime.bonus_after_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds < 0) {
      throw ConfigError("scoring.uptime.bonus_after_s must be greater than or equal to 0");
    }
    scoring.uptime_bonus_after_s = static_cast<std::uint64_t>(seconds);
  } else if (field == "status.healthy_min") {
    scoring.healthy_min = static_cast<int>(parse_integer(key, value));
  } else if (field == "status.degraded_min") {
    scoring.degraded_min = static_cast<int>(parse_integer(key, value));
  }
}

void apply_key_value(ServiceConfig& config, const std::string& key, const std::string& value) {
  if (key == "platform.override") {
    config.platform_override = value;
    return;
  }

  if (key == "metrics.cache_ttl_ms") {
    const auto ttl = parse_integer(key, value);
    if (ttl < 0) {
      throw ConfigError("metrics.cache_ttl_ms must be greater than or equal to 0");
    }
    config.cache_ttl = std::chrono::milliseconds(ttl);
    return;
  }

  if (key == "metrics.provider_timeout_ms") {
    const auto timeout = parse_integer(key, value);
    if (timeout <= 0) {
      throw ConfigError("metrics.provider_timeout_ms must be greater than 0");
    }
    config.provider_timeout = std::chrono::milliseconds(timeout);
    return;
  }

  if (key == "metrics.cpu_sample_window_ms") {
    const auto window = parse_integer(key, value);
    if (window < 0) {
      throw ConfigError("metrics.cpu_sample_window_ms must be greater than or equal to 0");
    }
    config.cpu_sample_window = std::chrono::milliseconds(window);
    return;
  }

  if (key == "metrics.worker_threads") {
    const auto threads = parse_integer(key, value);
    if (threads <= 0 || threads > 64) {
      throw ConfigError("metrics.worker_threads must be in range 1..64");
    }
    config.worker_threads = static_cast<std::size_t>(threads);
    return;
  }

  if (key == "metrics.disk_path") {
    config.disk_path = value;
    return;
  }

  if (key == "player.service") {
    config.player_service = value;
    return;
  }

  if (key == "screenshot.dir") {
    config.screenshot_dir = value;
    return;
  }

  if (key == "screenshot.command") {
    config.screenshot_command = value;
    return;
  }

  if (key == "actions.allowed_services") {
    config.allowed_services = split_list(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key.rfind("scoring.", 0) == 0) {
    apply_scoring_key(config.scoring, key, value);
    return;
  }

  if (key.rfind("providers.", 0) == 0) {
    const std::string provider_name = key.substr(std::string("providers.").size());
    config.provider_enabled[provider_name] = parse_bool(value);
  }
}

}  // namespace

ServiceConfig load_service_config(const std::string& path) {
  ServiceConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string raw_value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (raw_value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), unquote(raw_value));
  }

  validate_scoring_policy(config.scoring);
  return config;
}

void apply_environment_overrides(ServiceConfig& config) {
  if (const auto* platform = std::getenv("DEVICE_AGENT_PLATFORM"); platform != nullptr && *platform != '\0') {
    config.platform_override = std::string(platform);
  }

  if (const auto* ttl = std::getenv("DEVICE_AGENT_CACHE_TTL_MS"); ttl != nullptr && *ttl != '\0') {
    apply_key_value(config, "metrics.cache_ttl_ms", trim(ttl));
  }
}

void validate_scoring_policy(const ScoringPolicy& policy) {
  const auto check_factor = [](const char* name, const FactorPolicy& factor) {
    if (!std::isfinite(factor.warning_pct) || factor.warning_pct < 0.0F || factor.warning_pct >= 100.0F) {
      throw ConfigError(std::string("scoring.") + name + ".warning_pct must be in range [0,100)");
    }
    if (!std::isfinite(factor.max_penalty) || factor.max_penalty < 0.0F) {
      throw ConfigError(std::string("scoring.") + name + ".max_penalty must be a finite number >= 0");
    }
  };

  check_factor("cpu", policy.cpu);
  check_factor("memory", policy.memory);
  check_factor("disk", policy.disk);

  if (!std::isfinite(policy.unknown_penalty) || policy.unknown_penalty < 0.0F) {
    throw ConfigError("scoring.unknown_penalty must be a finite number >= 0");
  }
  if (!std::isfinite(policy.uptime_bonus) || policy.uptime_bonus < 0.0F) {
    throw ConfigError("scoring.uptime.bonus must be a finite number >= 0");
  }
  if (policy.healthy_min < 0 || policy.healthy_min > 100 || policy.degraded_min < 0 || policy.degraded_min > 100) {
    throw ConfigError("scoring.status thresholds must be in range 0..100");
  }
  if (policy.healthy_min <= policy.degraded_min) {
    throw ConfigError("scoring.status.healthy_min must be greater than scoring.status.degraded_min");
  }
}

bool provider_enabled(const ServiceConfig& config, const std::string& name) {
  const auto it = config.provider_enabled.find(name);
  if (it == config.provider_enabled.end()) {
    return true;
  }
  return it->second;
}

}  // namespace device_agent::core
