#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/health_score.hpp"
#include "model/metrics.hpp"

struct redisContext;

namespace device_agent::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"device"};
  std::uint32_t connect_timeout_ms{1000};
};

// Pushes each refreshed record with TS.MADD. Unknown fields are skipped.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::NormalizedMetrics& metrics, const model::HealthScore& score);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool ensure_schema();
  bool publish_impl(const model::NormalizedMetrics& metrics, const model::HealthScore& score);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace device_agent::sinks
