#pragma once

#include <string>
#include <vector>

namespace device_agent::providers {

struct CameraDevice {
  std::string node{};
  std::string name{};
};

class CameraProvider {
 public:
  virtual ~CameraProvider() = default;

  virtual std::vector<CameraDevice> inventory() = 0;
};

// Enumerates /dev/video* nodes and labels them from /sys/class/video4linux.
class V4l2CameraProvider final : public CameraProvider {
 public:
  explicit V4l2CameraProvider(std::string dev_root = "/dev", std::string sysfs_root = "/sys/class/video4linux");

  std::vector<CameraDevice> inventory() override;

 private:
  std::string dev_root_;
  std::string sysfs_root_;
};

}  // namespace device_agent::providers
