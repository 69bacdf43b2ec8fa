#pragma once

#include <cstdint>
#include <cstdio>

namespace device_agent::sensors {

class MemorySensor {
 public:
  struct RawFields {
    std::uint64_t mem_total_kb{0};
    std::uint64_t mem_available_kb{0};
    std::uint64_t swap_total_kb{0};
    std::uint64_t swap_free_kb{0};
  };

  MemorySensor();
  explicit MemorySensor(std::FILE* meminfo, bool owns_file = false);
  ~MemorySensor();

  MemorySensor(const MemorySensor&) = delete;
  MemorySensor& operator=(const MemorySensor&) = delete;

  bool sample() noexcept;
  const RawFields& raw() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* meminfo_{nullptr};
  bool owns_file_{true};
  RawFields raw_{};
};

}  // namespace device_agent::sensors
