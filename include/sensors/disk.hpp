#pragma once

#include <cstdint>
#include <string>

namespace device_agent::sensors {

// Filesystem capacity of the mount holding `path`.
class DiskUsageSensor {
 public:
  struct RawFields {
    std::uint64_t total_bytes{0};
    std::uint64_t used_bytes{0};
    std::uint64_t free_bytes{0};
  };

  explicit DiskUsageSensor(std::string path = "/");

  bool sample() noexcept;
  const RawFields& raw() const noexcept;
  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
  RawFields raw_{};
};

}  // namespace device_agent::sensors
