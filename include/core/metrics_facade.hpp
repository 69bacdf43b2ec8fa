#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/platform.hpp"
#include "core/registry.hpp"
#include "core/worker_pool.hpp"
#include "model/health_score.hpp"
#include "model/metrics.hpp"
#include "providers/health.hpp"
#include "risk/health_scorer.hpp"

namespace device_agent::core {

struct FacadeOptions {
  std::chrono::milliseconds cache_ttl{5000};
  std::chrono::milliseconds provider_timeout{2000};
  // Raised to the number of polled contracts when lower.
  std::size_t worker_threads{4};
};

struct FacadeStats {
  std::uint64_t collection_cycles{0};
  std::uint64_t cache_hits{0};
  std::uint64_t joined_waits{0};
};

using RefreshListener = std::function<void(const model::NormalizedMetrics&, const model::HealthScore&)>;

// Folds the merged provider output into the platform-agnostic record. Known
// keys fill the core fields; everything else lands in extras.
model::NormalizedMetrics normalize_sample(const model::RawMetricSample& merged, PlatformIdentity platform);

// Request-driven collection with a TTL cache. At most one refresh runs at a
// time; callers arriving during a refresh wait for its result.
class MetricsFacade {
 public:
  MetricsFacade(const ServiceRegistry& registry, PlatformIdentity platform,
                std::vector<Contract<providers::HealthProvider>> contracts, risk::HealthScorer scorer,
                FacadeOptions options);

  MetricsFacade(const MetricsFacade&) = delete;
  MetricsFacade& operator=(const MetricsFacade&) = delete;

  model::NormalizedMetrics collect();
  model::HealthScore collect_summary();

  void invalidate();
  [[nodiscard]] FacadeStats stats() const;

  // Listeners run on the refreshing thread after the cache is replaced.
  void add_refresh_listener(RefreshListener listener);

  [[nodiscard]] const FacadeOptions& options() const noexcept { return options_; }
  [[nodiscard]] const risk::HealthScorer& scorer() const noexcept { return scorer_; }

 private:
  model::NormalizedMetrics gather();

  const ServiceRegistry& registry_;
  PlatformIdentity platform_;
  std::vector<Contract<providers::HealthProvider>> contracts_;
  risk::HealthScorer scorer_;
  FacadeOptions options_;
  // Set while a provider call is running, including calls abandoned after their timeout.
  std::map<std::string, std::shared_ptr<std::atomic<bool>>> in_flight_;
  WorkerPool pool_;

  mutable std::mutex mutex_;
  std::condition_variable refreshed_;
  std::shared_ptr<const model::CacheEntry> cache_;
  bool refresh_in_flight_{false};
  bool last_refresh_ok_{false};
  std::uint64_t generation_{0};
  FacadeStats stats_{};
  std::vector<RefreshListener> listeners_;
};

}  // namespace device_agent::core
