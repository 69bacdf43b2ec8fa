#include "sensors/thermal.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <utility>

namespace device_agent::sensors {

namespace {
constexpr const char* kSysClassThermal = "/sys/class/thermal";
}

ThermalSensor::ThermalSensor() : owns_files_(true) { discover_zones(kSysClassThermal); }

ThermalSensor::ThermalSensor(const std::string& thermal_root) : owns_files_(true) { discover_zones(thermal_root); }

ThermalSensor::ThermalSensor(std::vector<ZoneSource> zones, const bool owns_files)
    : zones_(std::move(zones)), owns_files_(owns_files) {}

void ThermalSensor::discover_zones(const std::string& thermal_root) {
  try {
    if (!std::filesystem::exists(thermal_root)) {
      return;
    }

    for (const auto& entry : std::filesystem::directory_iterator(thermal_root)) {
      if (!entry.is_directory()) {
        continue;
      }

      const std::string name = entry.path().filename().string();
      if (name.rfind("thermal_zone", 0) != 0) {
        continue;
      }

      const std::filesystem::path zone_path = entry.path();

      std::ifstream type_file(zone_path / "type");
      std::string zone_name = name;
      if (type_file.is_open()) {
        std::getline(type_file, zone_name);
      }

      ZoneSource source{};
      source.name = zone_name;
      source.temp_path = (zone_path / "temp").string();

      auto file_closer = [](std::FILE* file) {
        if (file != nullptr) {
          std::fclose(file);
        }
      };
      using file_ptr = std::unique_ptr<std::FILE, decltype(file_closer)>;

      file_ptr file(std::fopen(source.temp_path.c_str(), "r"), file_closer);
      source.file = file.get();

      zones_.push_back(source);
      file.release();
    }
  } catch (const std::filesystem::filesystem_error&) {
    for (ZoneSource& zone : zones_) {
      if (zone.file != nullptr) {
        std::fclose(zone.file);
      }
    }
    zones_.clear();
  }
}

ThermalSensor::~ThermalSensor() {
  if (!owns_files_) {
    return;
  }

  for (ZoneSource& zone : zones_) {
    if (zone.file != nullptr) {
      std::fclose(zone.file);
      zone.file = nullptr;
    }
  }
}

bool ThermalSensor::sample() noexcept {
  raw_.hottest_zone.clear();
  raw_.hottest_temp_c = 0.0F;
  raw_.zones_read = 0;

  float max_temp_c = -std::numeric_limits<float>::infinity();
  std::size_t max_index = 0;

  for (std::size_t i = 0; i < zones_.size(); ++i) {
    ZoneSource& zone = zones_[i];
    bool opened_in_sample = false;
    if (zone.file == nullptr) {
      zone.file = std::fopen(zone.temp_path.c_str(), "r");
      if (zone.file == nullptr) {
        continue;
      }
      opened_in_sample = true;
    }

    float zone_temp_c = 0.0F;
    const bool read_ok = read_temp_c(zone.file, zone_temp_c);
    if (opened_in_sample && !owns_files_) {
      std::fclose(zone.file);
      zone.file = nullptr;
    }
    if (!read_ok) {
      continue;
    }
    ++raw_.zones_read;

    if (zone_temp_c > max_temp_c) {
      max_temp_c = zone_temp_c;
      max_index = i;
    }
  }

  if (!std::isfinite(max_temp_c)) {
    return false;
  }

  raw_.hottest_temp_c = max_temp_c;
  raw_.hottest_zone = zones_[max_index].name;
  return true;
}

const ThermalSensor::RawFields& ThermalSensor::raw() const noexcept { return raw_; }

bool ThermalSensor::read_temp_c(std::FILE* file, float& temp_c) noexcept {
  if (file == nullptr) {
    return false;
  }

  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }

  long long raw_temp = 0;
  if (std::fscanf(file, "%lld", &raw_temp) != 1) {
    std::clearerr(file);
    return false;
  }

  // sysfs reports millidegrees Celsius
  temp_c = static_cast<float>(raw_temp) / 1000.0F;
  return true;
}

}  // namespace device_agent::sensors
