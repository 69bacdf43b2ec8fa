#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "model/metrics.hpp"
#include "providers/health.hpp"
#include "sensors/cpu.hpp"
#include "sensors/disk.hpp"
#include "sensors/memory.hpp"
#include "sensors/network.hpp"
#include "sensors/thermal.hpp"
#include "sensors/uptime.hpp"

using device_agent::model::RawMetricSample;
using device_agent::providers::CpuHealthProvider;
using device_agent::providers::LoadHealthProvider;
using device_agent::providers::MemoryHealthProvider;
using device_agent::providers::NetworkHealthProvider;
using device_agent::providers::ThermalHealthProvider;
using device_agent::sensors::CpuSensor;
using device_agent::sensors::DiskUsageSensor;
using device_agent::sensors::MemorySensor;
using device_agent::sensors::NetworkSensor;
using device_agent::sensors::ThermalSensor;
using device_agent::sensors::UptimeSensor;

namespace {

bool almost_equal(double a, double b, double eps = 1e-3) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0) {
    return false;
  }
  if (ftruncate(fd, 0) != 0) {
    return false;
  }
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

int test_cpu_sensor_with_injected_proc_stat() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  100 20 30 400 50 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing first proc/stat snapshot");
  }

  CpuSensor sensor(stat_file, false);
  if (sensor.sample().has_value() || !sensor.has_baseline()) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "first sample should only record a baseline");
  }

  if (!write_temp_file(stat_file, "cpu  140 30 40 420 60 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing second proc/stat snapshot");
  }

  const auto utilization = sensor.sample();
  if (!utilization.has_value() || !almost_equal(*utilization, 66.6667)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "computed utilization mismatch");
  }

  std::fclose(stat_file);
  return 0;
}

int test_cpu_sensor_malformed_line_drops_baseline() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  100 20 30 400 50 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_malformed_line_drops_baseline", "failed writing proc/stat snapshot");
  }

  CpuSensor sensor(stat_file, false);
  sensor.sample();

  if (!write_temp_file(stat_file, "intr 12345\n")) {
    return fail("test_cpu_sensor_malformed_line_drops_baseline", "failed writing malformed snapshot");
  }
  if (sensor.sample().has_value() || sensor.has_baseline()) {
    return fail("test_cpu_sensor_malformed_line_drops_baseline", "malformed read should reset the baseline");
  }

  std::fclose(stat_file);
  return 0;
}

int test_cpu_provider_takes_baseline_and_reports_percent() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  100 0 0 100 0 0 0 0 0 0\n")) {
    return fail("test_cpu_provider_takes_baseline_and_reports_percent", "failed writing proc/stat snapshot");
  }

  CpuHealthProvider provider(std::make_unique<CpuSensor>(stat_file, false), std::chrono::milliseconds(0));
  RawMetricSample sample{};
  if (!provider.collect(sample)) {
    return fail("test_cpu_provider_takes_baseline_and_reports_percent", "collect should succeed");
  }

  // Unchanged counters between baseline and sample read as idle.
  if (sample.values.count("cpu_percent") != 1U || !almost_equal(sample.values["cpu_percent"], 0.0)) {
    return fail("test_cpu_provider_takes_baseline_and_reports_percent", "cpu_percent should be 0");
  }

  if (!write_temp_file(stat_file, "cpu  175 0 0 125 0 0 0 0 0 0\n")) {
    return fail("test_cpu_provider_takes_baseline_and_reports_percent", "failed writing second snapshot");
  }
  RawMetricSample second{};
  if (!provider.collect(second) || !almost_equal(second.values["cpu_percent"], 75.0)) {
    return fail("test_cpu_provider_takes_baseline_and_reports_percent", "second collect should reuse the baseline");
  }

  std::fclose(stat_file);
  return 0;
}

int test_memory_sensor_and_provider() {
  std::FILE* meminfo = std::tmpfile();
  if (!write_temp_file(meminfo,
                       "MemTotal:       8000000 kB\n"
                       "MemFree:         500000 kB\n"
                       "MemAvailable:   2000000 kB\n"
                       "SwapTotal:      1000000 kB\n"
                       "SwapFree:        750000 kB\n")) {
    return fail("test_memory_sensor_and_provider", "failed writing meminfo");
  }

  MemoryHealthProvider provider(std::make_unique<MemorySensor>(meminfo, false));
  RawMetricSample sample{};
  if (!provider.collect(sample)) {
    return fail("test_memory_sensor_and_provider", "collect should succeed");
  }

  if (!almost_equal(sample.values["memory_total_bytes"], 8000000.0 * 1024.0) ||
      !almost_equal(sample.values["memory_used_bytes"], 6000000.0 * 1024.0)) {
    return fail("test_memory_sensor_and_provider", "used/total bytes mismatch");
  }
  if (!almost_equal(sample.values["swap_percent"], 25.0)) {
    return fail("test_memory_sensor_and_provider", "swap percent mismatch");
  }

  if (!write_temp_file(meminfo, "MemTotal:       8000000 kB\nMemFree:         500000 kB\n")) {
    return fail("test_memory_sensor_and_provider", "failed writing truncated meminfo");
  }
  RawMetricSample missing{};
  if (provider.collect(missing)) {
    return fail("test_memory_sensor_and_provider", "missing MemAvailable should fail the read");
  }

  std::fclose(meminfo);
  return 0;
}

int test_uptime_and_loadavg_with_injected_files() {
  std::FILE* uptime = std::tmpfile();
  std::FILE* loadavg = std::tmpfile();
  if (!write_temp_file(uptime, "12345.67 40000.00\n") || !write_temp_file(loadavg, "0.50 1.25 2.00 1/234 5678\n")) {
    return fail("test_uptime_and_loadavg_with_injected_files", "failed writing proc files");
  }

  UptimeSensor sensor(uptime, loadavg, false);
  const auto seconds = sensor.uptime_seconds();
  if (!seconds.has_value() || !almost_equal(*seconds, 12345.67)) {
    return fail("test_uptime_and_loadavg_with_injected_files", "uptime mismatch");
  }

  const auto load = sensor.load_averages();
  if (!load.has_value() || !almost_equal(load->load_1m, 0.5) || !almost_equal(load->load_15m, 2.0)) {
    return fail("test_uptime_and_loadavg_with_injected_files", "load averages mismatch");
  }

  if (!write_temp_file(uptime, "garbage\n")) {
    return fail("test_uptime_and_loadavg_with_injected_files", "failed rewriting uptime");
  }
  if (sensor.uptime_seconds().has_value()) {
    return fail("test_uptime_and_loadavg_with_injected_files", "garbage uptime should be unknown");
  }

  LoadHealthProvider provider(std::make_unique<UptimeSensor>(uptime, loadavg, false));
  RawMetricSample sample{};
  if (!provider.collect(sample) || !almost_equal(sample.values["load_5m"], 1.25)) {
    return fail("test_uptime_and_loadavg_with_injected_files", "load provider should report load_5m");
  }

  std::fclose(uptime);
  std::fclose(loadavg);
  return 0;
}

int test_thermal_sensor_with_injected_zone_files() {
  std::FILE* zone0 = std::tmpfile();
  std::FILE* zone1 = std::tmpfile();
  if (!write_temp_file(zone0, "65000\n") || !write_temp_file(zone1, "72500\n")) {
    return fail("test_thermal_sensor_with_injected_zone_files", "failed writing thermal zone temp files");
  }

  std::vector<ThermalSensor::ZoneSource> zones{{"cpu-thermal", "", zone0}, {"gpu-thermal", "", zone1}};
  ThermalHealthProvider provider(std::make_unique<ThermalSensor>(std::move(zones), false));
  RawMetricSample sample{};
  if (!provider.collect(sample)) {
    return fail("test_thermal_sensor_with_injected_zone_files", "collect should succeed");
  }

  if (!almost_equal(sample.values["temperature_c"], 72.5) || sample.labels["thermal_zone"] != "gpu-thermal") {
    return fail("test_thermal_sensor_with_injected_zone_files", "hottest zone mismatch");
  }

  std::fclose(zone0);
  std::fclose(zone1);
  return 0;
}

int test_thermal_sensor_discovers_zones_under_root() {
  const auto root = std::filesystem::temp_directory_path() / "device_agent_thermal_root";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "thermal_zone0");
  std::filesystem::create_directories(root / "cooling_device0");
  {
    std::ofstream(root / "thermal_zone0" / "type") << "soc-thermal\n";
    std::ofstream(root / "thermal_zone0" / "temp") << "48000\n";
  }

  bool ok = false;
  {
    ThermalSensor sensor(root.string());
    ok = sensor.zone_count() == 1U && sensor.sample() && sensor.raw().hottest_zone == "soc-thermal";
  }
  std::filesystem::remove_all(root);

  if (!ok) {
    return fail("test_thermal_sensor_discovers_zones_under_root", "expected a single soc-thermal zone");
  }
  return 0;
}

int test_thermal_sensor_without_zones_fails() {
  ThermalSensor sensor(std::vector<ThermalSensor::ZoneSource>{}, false);
  if (sensor.sample()) {
    return fail("test_thermal_sensor_without_zones_fails", "no zones should yield no reading");
  }
  return 0;
}

int test_thermal_sensor_closes_lazily_opened_zone_files() {
  const auto path = std::filesystem::temp_directory_path() / "device_agent_lazy_zone_temp";
  std::ofstream(path) << "51000\n";

  ThermalSensor sensor(std::vector<ThermalSensor::ZoneSource>{{"soc-thermal", path.string(), nullptr}}, false);
  if (!sensor.sample() || !almost_equal(sensor.raw().hottest_temp_c, 51.0)) {
    std::filesystem::remove(path);
    return fail("test_thermal_sensor_closes_lazily_opened_zone_files", "first sample should open the zone path");
  }

  // A handle kept open would still read the unlinked file.
  std::filesystem::remove(path);
  if (sensor.sample()) {
    return fail("test_thermal_sensor_closes_lazily_opened_zone_files", "zone file should be reopened on every sample");
  }
  return 0;
}

int test_network_sensor_and_provider_under_root() {
  const auto root = std::filesystem::temp_directory_path() / "device_agent_net_root";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "eth0" / "statistics");
  std::filesystem::create_directories(root / "wlan0" / "statistics");
  std::filesystem::create_directories(root / "lo" / "statistics");
  {
    std::ofstream(root / "eth0" / "statistics" / "rx_bytes") << "1000\n";
    std::ofstream(root / "eth0" / "statistics" / "tx_bytes") << "400\n";
    std::ofstream(root / "eth0" / "statistics" / "rx_packets") << "10\n";
    std::ofstream(root / "eth0" / "statistics" / "tx_packets") << "4\n";
    std::ofstream(root / "eth0" / "operstate") << "up\n";
    std::ofstream(root / "eth0" / "mtu") << "1500\n";
    std::ofstream(root / "wlan0" / "statistics" / "rx_bytes") << "24\n";
    std::ofstream(root / "wlan0" / "statistics" / "tx_bytes") << "0\n";
    std::ofstream(root / "wlan0" / "operstate") << "down\n";
    std::ofstream(root / "lo" / "statistics" / "rx_bytes") << "99999\n";
    std::ofstream(root / "lo" / "statistics" / "tx_bytes") << "99999\n";
  }

  RawMetricSample sample{};
  bool collected = false;
  std::size_t interfaces = 0;
  {
    auto sensor = std::make_unique<NetworkSensor>(root.string());
    interfaces = sensor->interface_count();
    NetworkHealthProvider provider(std::move(sensor));
    collected = provider.collect(sample);
  }
  std::filesystem::remove_all(root);

  if (interfaces != 2U || !collected) {
    return fail("test_network_sensor_and_provider_under_root", "loopback should be skipped and the rest read");
  }
  if (!almost_equal(sample.values["network_bytes_received"], 1024.0) ||
      !almost_equal(sample.values["network_bytes_sent"], 400.0) ||
      !almost_equal(sample.values["network_packets_received"], 10.0)) {
    return fail("test_network_sensor_and_provider_under_root", "counter totals mismatch");
  }
  if (!almost_equal(sample.values["network_eth0_up"], 1.0) || !almost_equal(sample.values["network_wlan0_up"], 0.0) ||
      !almost_equal(sample.values["network_eth0_mtu"], 1500.0) || sample.values.count("network_wlan0_mtu") != 0U ||
      !almost_equal(sample.values["network_interfaces_up"], 1.0)) {
    return fail("test_network_sensor_and_provider_under_root", "per-interface state mismatch");
  }

  NetworkSensor empty(std::vector<NetworkSensor::InterfaceSource>{}, false);
  if (empty.sample()) {
    return fail("test_network_sensor_and_provider_under_root", "no interfaces should yield no reading");
  }
  return 0;
}

int test_disk_sensor_reports_capacity_of_existing_path() {
  DiskUsageSensor sensor(std::filesystem::temp_directory_path().string());
  if (!sensor.sample()) {
    return fail("test_disk_sensor_reports_capacity_of_existing_path", "statvfs on the temp dir should succeed");
  }
  if (sensor.raw().total_bytes == 0U || sensor.raw().used_bytes > sensor.raw().total_bytes) {
    return fail("test_disk_sensor_reports_capacity_of_existing_path", "capacity fields inconsistent");
  }

  DiskUsageSensor missing("/nonexistent/device-agent/path");
  if (missing.sample()) {
    return fail("test_disk_sensor_reports_capacity_of_existing_path", "missing path should fail");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cpu_sensor_with_injected_proc_stat(); rc != 0) {
    return rc;
  }
  if (int rc = test_cpu_sensor_malformed_line_drops_baseline(); rc != 0) {
    return rc;
  }
  if (int rc = test_cpu_provider_takes_baseline_and_reports_percent(); rc != 0) {
    return rc;
  }
  if (int rc = test_memory_sensor_and_provider(); rc != 0) {
    return rc;
  }
  if (int rc = test_uptime_and_loadavg_with_injected_files(); rc != 0) {
    return rc;
  }
  if (int rc = test_thermal_sensor_with_injected_zone_files(); rc != 0) {
    return rc;
  }
  if (int rc = test_thermal_sensor_discovers_zones_under_root(); rc != 0) {
    return rc;
  }
  if (int rc = test_thermal_sensor_without_zones_fails(); rc != 0) {
    return rc;
  }
  if (int rc = test_thermal_sensor_closes_lazily_opened_zone_files(); rc != 0) {
    return rc;
  }
  if (int rc = test_network_sensor_and_provider_under_root(); rc != 0) {
    return rc;
  }
  if (int rc = test_disk_sensor_reports_capacity_of_existing_path(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
