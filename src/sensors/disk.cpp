#include "sensors/disk.hpp"

#include <sys/statvfs.h>

#include <utility>

namespace device_agent::sensors {

DiskUsageSensor::DiskUsageSensor(std::string path) : path_(std::move(path)) {}

bool DiskUsageSensor::sample() noexcept {
  raw_ = {};

  struct statvfs stats {};
  if (statvfs(path_.c_str(), &stats) != 0) {
    return false;
  }

  const std::uint64_t fragment = stats.f_frsize != 0 ? stats.f_frsize : stats.f_bsize;
  raw_.total_bytes = static_cast<std::uint64_t>(stats.f_blocks) * fragment;
  raw_.free_bytes = static_cast<std::uint64_t>(stats.f_bavail) * fragment;
  const std::uint64_t unused = static_cast<std::uint64_t>(stats.f_bfree) * fragment;
  raw_.used_bytes = raw_.total_bytes >= unused ? raw_.total_bytes - unused : 0;
  return raw_.total_bytes != 0;
}

const DiskUsageSensor::RawFields& DiskUsageSensor::raw() const noexcept { return raw_; }

}  // namespace device_agent::sensors
