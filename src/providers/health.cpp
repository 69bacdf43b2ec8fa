#include "providers/health.hpp"

#include <sys/utsname.h>

#include <fstream>
#include <string>
#include <thread>
#include <utility>

namespace device_agent::providers {
namespace {

constexpr double kBytesPerKb = 1024.0;

std::string read_first_line(const std::string& path) {
  std::ifstream input(path);
  std::string line;
  if (!input.is_open() || !std::getline(input, line)) {
    return {};
  }
  // device-tree strings are NUL terminated
  const auto nul = line.find('\0');
  if (nul != std::string::npos) {
    line.erase(nul);
  }
  return line;
}

}  // namespace

CpuHealthProvider::CpuHealthProvider(std::unique_ptr<sensors::CpuSensor> sensor,
                                     const std::chrono::milliseconds sample_window)
    : sensor_(std::move(sensor)), sample_window_(sample_window) {}

bool CpuHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();

  // A stale baseline would average over the whole idle period between requests.
  if (!sensor_->has_baseline() || now - last_sample_ > kBaselineMaxAge) {
    sensor_->reset();
    sensor_->sample();
    if (!sensor_->has_baseline()) {
      return false;
    }
    std::this_thread::sleep_for(sample_window_);
  }

  const auto utilization = sensor_->sample();
  if (!utilization.has_value()) {
    return false;
  }

  last_sample_ = std::chrono::steady_clock::now();
  sample.set("cpu_percent", static_cast<double>(*utilization));
  return true;
}

MemoryHealthProvider::MemoryHealthProvider(std::unique_ptr<sensors::MemorySensor> sensor)
    : sensor_(std::move(sensor)) {}

bool MemoryHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sensor_->sample()) {
    return false;
  }

  const auto& raw = sensor_->raw();
  const auto used_kb = raw.mem_total_kb >= raw.mem_available_kb ? raw.mem_total_kb - raw.mem_available_kb : 0U;
  sample.set("memory_total_bytes", static_cast<double>(raw.mem_total_kb) * kBytesPerKb);
  sample.set("memory_used_bytes", static_cast<double>(used_kb) * kBytesPerKb);

  if (raw.swap_total_kb > 0U) {
    const auto swap_used_kb = raw.swap_total_kb >= raw.swap_free_kb ? raw.swap_total_kb - raw.swap_free_kb : 0U;
    sample.set("swap_percent", 100.0 * static_cast<double>(swap_used_kb) / static_cast<double>(raw.swap_total_kb));
  }
  return true;
}

DiskHealthProvider::DiskHealthProvider(std::string path) : sensor_(std::move(path)) {}

bool DiskHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sensor_.sample()) {
    return false;
  }

  const auto& raw = sensor_.raw();
  sample.set("disk_total_bytes", static_cast<double>(raw.total_bytes));
  sample.set("disk_used_bytes", static_cast<double>(raw.used_bytes));
  sample.label("disk_path", sensor_.path());
  return true;
}

UptimeHealthProvider::UptimeHealthProvider(std::unique_ptr<sensors::UptimeSensor> sensor)
    : sensor_(std::move(sensor)) {}

bool UptimeHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto seconds = sensor_->uptime_seconds();
  if (!seconds.has_value()) {
    return false;
  }
  sample.set("uptime_seconds", *seconds);
  return true;
}

LoadHealthProvider::LoadHealthProvider(std::unique_ptr<sensors::UptimeSensor> sensor) : sensor_(std::move(sensor)) {}

bool LoadHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto load = sensor_->load_averages();
  if (!load.has_value()) {
    return false;
  }

  sample.set("load_1m", load->load_1m);
  sample.set("load_5m", load->load_5m);
  sample.set("load_15m", load->load_15m);
  if (const unsigned cores = std::thread::hardware_concurrency(); cores > 0U) {
    sample.set("cpu_cores", static_cast<double>(cores));
  }
  return true;
}

NetworkHealthProvider::NetworkHealthProvider(std::unique_ptr<sensors::NetworkSensor> sensor)
    : sensor_(std::move(sensor)) {}

bool NetworkHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sensor_->sample()) {
    return false;
  }

  const auto& raw = sensor_->raw();
  sample.set("network_bytes_received", static_cast<double>(raw.bytes_received));
  sample.set("network_bytes_sent", static_cast<double>(raw.bytes_sent));
  sample.set("network_packets_received", static_cast<double>(raw.packets_received));
  sample.set("network_packets_sent", static_cast<double>(raw.packets_sent));

  double interfaces_up = 0.0;
  for (const auto& iface : raw.interfaces) {
    const std::string prefix = "network_" + iface.name;
    sample.set(prefix + "_up", iface.up ? 1.0 : 0.0);
    if (iface.mtu > 0U) {
      sample.set(prefix + "_mtu", static_cast<double>(iface.mtu));
    }
    interfaces_up += iface.up ? 1.0 : 0.0;
  }
  sample.set("network_interfaces_up", interfaces_up);
  return true;
}

ThermalHealthProvider::ThermalHealthProvider(std::unique_ptr<sensors::ThermalSensor> sensor)
    : sensor_(std::move(sensor)) {}

bool ThermalHealthProvider::collect(model::RawMetricSample& sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sensor_->sample()) {
    return false;
  }

  const auto& raw = sensor_->raw();
  sample.set("temperature_c", static_cast<double>(raw.hottest_temp_c));
  sample.label("thermal_zone", raw.hottest_zone);
  return true;
}

DeviceInfoHealthProvider::DeviceInfoHealthProvider(std::string device_tree_model_path)
    : device_tree_model_path_(std::move(device_tree_model_path)) {}

bool DeviceInfoHealthProvider::collect(model::RawMetricSample& sample) {
  bool any = false;

  if (std::string model = read_first_line(device_tree_model_path_); !model.empty()) {
    sample.label("device_model", std::move(model));
    any = true;
  }

  utsname info{};
  if (uname(&info) == 0) {
    sample.label("hostname", info.nodename);
    sample.label("kernel_release", info.release);
    any = true;
  }
  return any;
}

std::shared_ptr<HealthProvider> make_cpu_provider(const std::chrono::milliseconds sample_window) {
  return std::make_shared<CpuHealthProvider>(std::make_unique<sensors::CpuSensor>(), sample_window);
}

std::shared_ptr<HealthProvider> make_memory_provider() {
  return std::make_shared<MemoryHealthProvider>(std::make_unique<sensors::MemorySensor>());
}

std::shared_ptr<HealthProvider> make_disk_provider(const std::string& path) {
  return std::make_shared<DiskHealthProvider>(path);
}

std::shared_ptr<HealthProvider> make_uptime_provider() {
  return std::make_shared<UptimeHealthProvider>(std::make_unique<sensors::UptimeSensor>());
}

std::shared_ptr<HealthProvider> make_load_provider() {
  return std::make_shared<LoadHealthProvider>(std::make_unique<sensors::UptimeSensor>());
}

std::shared_ptr<HealthProvider> make_network_provider() {
  return std::make_shared<NetworkHealthProvider>(std::make_unique<sensors::NetworkSensor>());
}

std::shared_ptr<HealthProvider> make_thermal_provider() {
  return std::make_shared<ThermalHealthProvider>(std::make_unique<sensors::ThermalSensor>());
}

std::shared_ptr<HealthProvider> make_device_info_provider(const std::string& device_tree_model_path) {
  return std::make_shared<DeviceInfoHealthProvider>(device_tree_model_path);
}

}  // namespace device_agent::providers
