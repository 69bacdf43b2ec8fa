#include "core/metrics_facade.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include "core/math.hpp"

namespace device_agent::core {
namespace {

using SampleResult = std::optional<model::RawMetricSample>;

std::optional<double> find_value(const model::RawMetricSample& sample, const char* key) {
  const auto it = sample.values.find(key);
  if (it == sample.values.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Percent taken directly, or derived from used/total. A zero total is unknown.
std::optional<float> percent_field(const model::RawMetricSample& sample, const char* percent_key,
                                   const char* used_key, const char* total_key) {
  if (const auto percent = find_value(sample, percent_key)) {
    return sanitize_percent(*percent);
  }

  const auto used = find_value(sample, used_key);
  const auto total = find_value(sample, total_key);
  if (!used.has_value() || !total.has_value() || !std::isfinite(*total) || *total <= 0.0) {
    return std::nullopt;
  }
  return sanitize_percent(100.0 * *used / *total);
}

struct InFlightRelease {
  std::shared_ptr<std::atomic<bool>> flag;
  ~InFlightRelease() { flag->store(false); }
};

struct PendingCall {
  std::string contract{};
  std::future<SampleResult> result{};
  // Set once the fan-in has given up, so a call still queued never reaches the provider.
  std::shared_ptr<std::atomic<bool>> abandoned{};
};

}  // namespace

model::NormalizedMetrics normalize_sample(const model::RawMetricSample& merged, const PlatformIdentity platform) {
  static const std::set<std::string> kCoreKeys = {
      "cpu_percent",     "memory_percent",   "memory_used_bytes", "memory_total_bytes",
      "disk_percent",    "disk_used_bytes",  "disk_total_bytes",  "uptime_seconds",
  };

  model::NormalizedMetrics metrics{};
  metrics.platform = platform;
  metrics.timestamp = std::chrono::system_clock::now();

  if (const auto cpu = find_value(merged, "cpu_percent")) {
    metrics.cpu_percent = sanitize_percent(*cpu);
  }
  metrics.memory_percent = percent_field(merged, "memory_percent", "memory_used_bytes", "memory_total_bytes");
  metrics.disk_percent = percent_field(merged, "disk_percent", "disk_used_bytes", "disk_total_bytes");

  // 2^64 itself is representable as a double, so the bound is exclusive.
  constexpr double kUptimeLimit = static_cast<double>(std::numeric_limits<std::uint64_t>::max());
  if (const auto uptime = find_value(merged, "uptime_seconds"); uptime.has_value() && std::isfinite(*uptime) &&
                                                                *uptime >= 0.0 && *uptime < kUptimeLimit) {
    metrics.uptime_seconds = static_cast<std::uint64_t>(*uptime);
  }

  for (const auto& [key, value] : merged.values) {
    if (kCoreKeys.count(key) == 0U && std::isfinite(value)) {
      metrics.extras.emplace(key, value);
    }
  }
  for (const auto& [key, value] : merged.labels) {
    metrics.extras.emplace(key, value);
  }
  return metrics;
}

MetricsFacade::MetricsFacade(const ServiceRegistry& registry, const PlatformIdentity platform,
                             std::vector<Contract<providers::HealthProvider>> contracts, risk::HealthScorer scorer,
                             FacadeOptions options)
    : registry_(registry),
      platform_(platform),
      contracts_(std::move(contracts)),
      scorer_(std::move(scorer)),
      options_(options),
      pool_(std::max(options.worker_threads, contracts_.size())) {
  // One thread per polled contract: a provider stuck past its timeout holds a
  // thread, and every other provider must still start immediately.
  options_.worker_threads = pool_.size();
  for (const auto& contract : contracts_) {
    in_flight_.emplace(contract.name, std::make_shared<std::atomic<bool>>(false));
  }
}

model::NormalizedMetrics MetricsFacade::collect() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    if (cache_ != nullptr && std::chrono::steady_clock::now() - cache_->captured_at < options_.cache_ttl) {
      ++stats_.cache_hits;
      return cache_->metrics;
    }
    if (!refresh_in_flight_) {
      break;
    }

    ++stats_.joined_waits;
    const std::uint64_t observed = generation_;
    refreshed_.wait(lock, [this, observed] { return generation_ != observed; });
    if (last_refresh_ok_ && cache_ != nullptr) {
      return cache_->metrics;
    }
  }

  refresh_in_flight_ = true;
  lock.unlock();

  model::NormalizedMetrics fresh{};
  try {
    fresh = gather();
  } catch (...) {
    lock.lock();
    refresh_in_flight_ = false;
    last_refresh_ok_ = false;
    ++generation_;
    lock.unlock();
    refreshed_.notify_all();
    throw;
  }

  auto entry = std::make_shared<const model::CacheEntry>(model::CacheEntry{fresh, std::chrono::steady_clock::now()});

  lock.lock();
  cache_ = entry;
  refresh_in_flight_ = false;
  last_refresh_ok_ = true;
  ++generation_;
  ++stats_.collection_cycles;
  const std::vector<RefreshListener> listeners = listeners_;
  lock.unlock();
  refreshed_.notify_all();

  if (!listeners.empty()) {
    const model::HealthScore score = scorer_.score(entry->metrics);
    for (const auto& listener : listeners) {
      try {
        listener(entry->metrics, score);
      } catch (const std::exception& ex) {
        std::cerr << "[metrics] refresh listener failed: " << ex.what() << '\n';
      }
    }
  }

  return entry->metrics;
}

model::HealthScore MetricsFacade::collect_summary() { return scorer_.score(collect()); }

void MetricsFacade::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.reset();
}

FacadeStats MetricsFacade::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void MetricsFacade::add_refresh_listener(RefreshListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

model::NormalizedMetrics MetricsFacade::gather() {
  std::map<std::string, model::ProviderOutcome> outcomes;
  std::vector<PendingCall> pending;
  pending.reserve(contracts_.size());

  for (const auto& contract : contracts_) {
    const auto resolution = registry_.lookup(contract);
    if (!resolution.available()) {
      continue;
    }

    const auto flag = in_flight_.at(contract.name);
    if (flag->exchange(true)) {
      std::cerr << "[metrics] provider " << contract.name << " still running from a previous cycle\n";
      outcomes[contract.name] = model::ProviderOutcome::BUSY;
      continue;
    }

    const std::shared_ptr<providers::HealthProvider> provider = resolution.shared();
    const std::string name = contract.name;
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    pending.push_back({name, pool_.submit([provider, flag, abandoned, name]() -> SampleResult {
                         const InFlightRelease release{flag};
                         if (abandoned->load()) {
                           return std::nullopt;
                         }
                         model::RawMetricSample sample{};
                         try {
                           if (provider->collect(sample)) {
                             return sample;
                           }
                         } catch (const std::exception& ex) {
                           std::cerr << "[metrics] provider " << name << " threw: " << ex.what() << '\n';
                         }
                         return std::nullopt;
                       }),
                       abandoned});
  }

  // Every call was submitted together, so one deadline bounds the whole fan-in.
  const auto deadline = std::chrono::steady_clock::now() + options_.provider_timeout;

  model::RawMetricSample merged{};
  for (auto& call : pending) {
    if (call.result.wait_until(deadline) != std::future_status::ready) {
      call.abandoned->store(true);
      std::cerr << "[metrics] provider " << call.contract << " timed out after "
                << options_.provider_timeout.count() << "ms\n";
      outcomes[call.contract] = model::ProviderOutcome::TIMEOUT;
      continue;
    }

    SampleResult sample = call.result.get();
    if (!sample.has_value()) {
      std::cerr << "[metrics] provider " << call.contract << " failed\n";
      outcomes[call.contract] = model::ProviderOutcome::FAILED;
      continue;
    }

    outcomes[call.contract] = model::ProviderOutcome::OK;
    for (const auto& [key, value] : sample->values) {
      merged.values[key] = value;
    }
    for (const auto& [key, value] : sample->labels) {
      merged.labels[key] = value;
    }
  }

  model::NormalizedMetrics metrics = normalize_sample(merged, platform_);
  metrics.sources = std::move(outcomes);
  return metrics;
}

}  // namespace device_agent::core
