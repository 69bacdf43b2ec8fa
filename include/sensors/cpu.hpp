#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>

namespace device_agent::sensors {

class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Utilization in percent since the previous successful read. The first read
  // only records a baseline and yields nullopt.
  std::optional<float> sample() noexcept;

  [[nodiscard]] bool has_baseline() const noexcept { return has_prev_; }
  void reset() noexcept { has_prev_ = false; }

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  bool read_counters(std::uint64_t& total, std::uint64_t& idle) noexcept;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::uint64_t prev_total_{0};
  std::uint64_t prev_idle_{0};
  bool has_prev_{false};
};

}  // namespace device_agent::sensors
