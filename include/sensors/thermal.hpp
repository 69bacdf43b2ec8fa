#pragma once

#include <cstdio>
#include <string>
#include <vector>

namespace device_agent::sensors {

class ThermalSensor {
 public:
  struct ZoneSource {
    std::string name{};
    std::string temp_path{};
    std::FILE* file{nullptr};
  };

  struct RawFields {
    std::string hottest_zone{};
    float hottest_temp_c{0.0F};
    std::size_t zones_read{0};
  };

  ThermalSensor();
  explicit ThermalSensor(const std::string& thermal_root);
  ThermalSensor(std::vector<ZoneSource> zones, bool owns_files = false);
  ~ThermalSensor();

  ThermalSensor(const ThermalSensor&) = delete;
  ThermalSensor& operator=(const ThermalSensor&) = delete;
  ThermalSensor(ThermalSensor&&) = delete;
  ThermalSensor& operator=(ThermalSensor&&) = delete;

  bool sample() noexcept;
  const RawFields& raw() const noexcept;
  [[nodiscard]] std::size_t zone_count() const noexcept { return zones_.size(); }

 private:
  void discover_zones(const std::string& thermal_root);
  static bool read_temp_c(std::FILE* file, float& temp_c) noexcept;

  std::vector<ZoneSource> zones_{};
  bool owns_files_{true};
  RawFields raw_{};
};

}  // namespace device_agent::sensors
