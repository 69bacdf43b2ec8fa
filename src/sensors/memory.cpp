#include "sensors/memory.hpp"

#include <cstring>

namespace device_agent::sensors {

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

bool MemorySensor::sample() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};
  bool saw_available = false;

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu kB", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
      saw_available = true;
    } else if (std::strcmp(key, "SwapTotal") == 0) {
      raw_.swap_total_kb = value;
    } else if (std::strcmp(key, "SwapFree") == 0) {
      raw_.swap_free_kb = value;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }
  std::clearerr(meminfo_);

  return raw_.mem_total_kb != 0 && saw_available;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

}  // namespace device_agent::sensors
