#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "model/metrics.hpp"
#include "sensors/cpu.hpp"
#include "sensors/disk.hpp"
#include "sensors/memory.hpp"
#include "sensors/network.hpp"
#include "sensors/thermal.hpp"
#include "sensors/uptime.hpp"

namespace device_agent::providers {

// A metrics contributor. collect() may block on the OS; the caller bounds it
// with a timeout and treats `false` as "fields unknown for this cycle".
class HealthProvider {
 public:
  virtual ~HealthProvider() = default;

  virtual const char* name() const = 0;
  virtual bool collect(model::RawMetricSample& sample) = 0;
};

class CpuHealthProvider final : public HealthProvider {
 public:
  CpuHealthProvider(std::unique_ptr<sensors::CpuSensor> sensor, std::chrono::milliseconds sample_window);

  const char* name() const override { return "cpu"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  static constexpr std::chrono::seconds kBaselineMaxAge{5};

  std::mutex mutex_;
  std::unique_ptr<sensors::CpuSensor> sensor_;
  std::chrono::milliseconds sample_window_;
  std::chrono::steady_clock::time_point last_sample_{};
};

class MemoryHealthProvider final : public HealthProvider {
 public:
  explicit MemoryHealthProvider(std::unique_ptr<sensors::MemorySensor> sensor);

  const char* name() const override { return "memory"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<sensors::MemorySensor> sensor_;
};

class DiskHealthProvider final : public HealthProvider {
 public:
  explicit DiskHealthProvider(std::string path);

  const char* name() const override { return "disk"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  sensors::DiskUsageSensor sensor_;
};

class UptimeHealthProvider final : public HealthProvider {
 public:
  explicit UptimeHealthProvider(std::unique_ptr<sensors::UptimeSensor> sensor);

  const char* name() const override { return "uptime"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<sensors::UptimeSensor> sensor_;
};

// Load averages plus the online core count.
class LoadHealthProvider final : public HealthProvider {
 public:
  explicit LoadHealthProvider(std::unique_ptr<sensors::UptimeSensor> sensor);

  const char* name() const override { return "load"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<sensors::UptimeSensor> sensor_;
};

// Totals across non-loopback interfaces, plus link state and mtu per interface.
class NetworkHealthProvider final : public HealthProvider {
 public:
  explicit NetworkHealthProvider(std::unique_ptr<sensors::NetworkSensor> sensor);

  const char* name() const override { return "network"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<sensors::NetworkSensor> sensor_;
};

class ThermalHealthProvider final : public HealthProvider {
 public:
  explicit ThermalHealthProvider(std::unique_ptr<sensors::ThermalSensor> sensor);

  const char* name() const override { return "thermal"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<sensors::ThermalSensor> sensor_;
};

// Static identity of the board: device-tree model, hostname, kernel release.
class DeviceInfoHealthProvider final : public HealthProvider {
 public:
  explicit DeviceInfoHealthProvider(std::string device_tree_model_path);

  const char* name() const override { return "device"; }
  bool collect(model::RawMetricSample& sample) override;

 private:
  std::string device_tree_model_path_;
};

std::shared_ptr<HealthProvider> make_cpu_provider(std::chrono::milliseconds sample_window);
std::shared_ptr<HealthProvider> make_memory_provider();
std::shared_ptr<HealthProvider> make_disk_provider(const std::string& path);
std::shared_ptr<HealthProvider> make_uptime_provider();
std::shared_ptr<HealthProvider> make_load_provider();
std::shared_ptr<HealthProvider> make_network_provider();
std::shared_ptr<HealthProvider> make_thermal_provider();
std::shared_ptr<HealthProvider> make_device_info_provider(const std::string& device_tree_model_path);

}  // namespace device_agent::providers
