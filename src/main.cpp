#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "api/methods.hpp"
#include "api/server.hpp"
#include "core/config.hpp"
#include "core/context.hpp"
#include "core/errors.hpp"
#include "providers/bindings.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

std::string format_config_settings(const device_agent::core::ServiceConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | platform_override=" << config.platform_override.value_or("none")
         << " | cache_ttl_ms=" << config.cache_ttl.count()
         << " | provider_timeout_ms=" << config.provider_timeout.count()
         << " | worker_threads=" << config.worker_threads
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

void attach_sinks(device_agent::core::DeviceContext& context) {
  const auto& config = context.config();

  if (config.stdout_debug) {
    // stdout carries the JSON-RPC stream
    auto sink = std::make_shared<device_agent::sinks::StdoutDebugSink>(stderr);
    context.metrics().add_refresh_listener(
        [sink](const auto& metrics, const auto& score) { sink->publish(metrics, score); });
  }

  if (config.redis.enabled) {
    device_agent::sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.key_prefix = config.redis.key_prefix;

    auto sink = std::make_shared<device_agent::sinks::RedisTsSink>(options);
    if (!sink->check_connectivity()) {
      std::cerr << "[redis] not reachable at startup; will retry on each refresh\n";
    }
    auto mutex = std::make_shared<std::mutex>();
    context.metrics().add_refresh_listener([sink, mutex](const auto& metrics, const auto& score) {
      std::lock_guard<std::mutex> lock(*mutex);
      sink->publish(metrics, score);
    });
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "configs/device-agent.yaml";

  device_agent::core::ServiceConfig config{};
  try {
    config = device_agent::core::load_service_config(config_path);
    device_agent::core::apply_environment_overrides(config);
  } catch (const device_agent::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<device_agent::core::DeviceContext> context;
  try {
    context = device_agent::core::DeviceContext::bootstrap(config, device_agent::core::PlatformDetector{},
                                                           device_agent::providers::default_factory_registry());
  } catch (const device_agent::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "bootstrap error: " << ex.what() << '\n';
    return 2;
  }

  attach_sinks(*context);

  const device_agent::api::Server server(device_agent::api::build_method_table(*context));
  const int rc = server.run(std::cin, std::cout, std::cerr);

  std::cerr << "[agent] input closed; exiting\n";
  return rc;
}
