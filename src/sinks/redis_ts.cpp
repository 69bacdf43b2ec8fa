#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <cstddef>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace device_agent::sinks {
namespace {

constexpr std::size_t kMaxMetricCount = 6;
constexpr std::size_t kMaxCommandArgCount = 1 + (kMaxMetricCount * 3);

constexpr const char* kMetricSuffixes[kMaxMetricCount] = {
    "cpu_percent", "memory_percent", "disk_percent", "uptime_seconds", "score", "status",
};

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix, const std::uint64_t timestamp_ms,
                     const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const char* suffix : kMetricSuffixes) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply =
        static_cast<redisReply*>(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::NormalizedMetrics& metrics, const model::HealthScore& score) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(metrics, score)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(metrics, score);
}

bool RedisTsSink::publish_impl(const model::NormalizedMetrics& metrics, const model::HealthScore& score) {
  const std::uint64_t timestamp_ms = core::to_unix_ms(metrics.timestamp);

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_percent = [&](const char* suffix, const std::optional<float>& value) {
    if (value.has_value()) {
      add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, static_cast<double>(*value));
    }
  };

  append_percent("cpu_percent", metrics.cpu_percent);
  append_percent("memory_percent", metrics.memory_percent);
  append_percent("disk_percent", metrics.disk_percent);
  if (metrics.uptime_seconds.has_value()) {
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "uptime_seconds",
                    static_cast<double>(*metrics.uptime_seconds));
  }
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "score", static_cast<double>(score.score));
  add_metric_args(command_args_, options_.key_prefix, timestamp_ms, "status",
                  static_cast<double>(static_cast<std::uint8_t>(score.status)));

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    std::cerr << "[redis] TS.MADD failed: no reply\n";
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] TS.MADD rejected: " << (reply->str != nullptr ? reply->str : "unknown") << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace device_agent::sinks
