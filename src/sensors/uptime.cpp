#include "sensors/uptime.hpp"

#include <cmath>

namespace device_agent::sensors {

UptimeSensor::UptimeSensor()
    : uptime_(std::fopen("/proc/uptime", "r")), loadavg_(std::fopen("/proc/loadavg", "r")) {}

UptimeSensor::UptimeSensor(std::FILE* uptime, std::FILE* loadavg, const bool owns_files)
    : uptime_(uptime), loadavg_(loadavg), owns_files_(owns_files) {}

UptimeSensor::~UptimeSensor() {
  if (owns_files_ && uptime_ != nullptr) {
    std::fclose(uptime_);
    uptime_ = nullptr;
  }
  if (owns_files_ && loadavg_ != nullptr) {
    std::fclose(loadavg_);
    loadavg_ = nullptr;
  }
}

std::optional<double> UptimeSensor::uptime_seconds() noexcept {
  if (uptime_ == nullptr || std::fseek(uptime_, 0L, SEEK_SET) != 0) {
    return std::nullopt;
  }

  double seconds = 0.0;
  if (std::fscanf(uptime_, "%lf", &seconds) != 1) {
    std::clearerr(uptime_);
    return std::nullopt;
  }
  if (!std::isfinite(seconds) || seconds < 0.0) {
    return std::nullopt;
  }
  return seconds;
}

std::optional<UptimeSensor::LoadAverages> UptimeSensor::load_averages() noexcept {
  if (loadavg_ == nullptr || std::fseek(loadavg_, 0L, SEEK_SET) != 0) {
    return std::nullopt;
  }

  LoadAverages load{};
  if (std::fscanf(loadavg_, "%lf %lf %lf", &load.load_1m, &load.load_5m, &load.load_15m) != 3) {
    std::clearerr(loadavg_);
    return std::nullopt;
  }
  return load;
}

}  // namespace device_agent::sensors
