#pragma once

#include <cstdio>
#include <optional>

namespace device_agent::sensors {

// Reads /proc/uptime and /proc/loadavg.
class UptimeSensor {
 public:
  struct LoadAverages {
    double load_1m{0.0};
    double load_5m{0.0};
    double load_15m{0.0};
  };

  UptimeSensor();
  UptimeSensor(std::FILE* uptime, std::FILE* loadavg, bool owns_files = false);
  ~UptimeSensor();

  UptimeSensor(const UptimeSensor&) = delete;
  UptimeSensor& operator=(const UptimeSensor&) = delete;

  std::optional<double> uptime_seconds() noexcept;
  std::optional<LoadAverages> load_averages() noexcept;

 private:
  std::FILE* uptime_{nullptr};
  std::FILE* loadavg_{nullptr};
  bool owns_files_{true};
};

}  // namespace device_agent::sensors
