#include "providers/camera.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace device_agent::providers {

V4l2CameraProvider::V4l2CameraProvider(std::string dev_root, std::string sysfs_root)
    : dev_root_(std::move(dev_root)), sysfs_root_(std::move(sysfs_root)) {}

std::vector<CameraDevice> V4l2CameraProvider::inventory() {
  std::vector<CameraDevice> devices;

  std::error_code ec;
  std::filesystem::directory_iterator it(dev_root_, ec);
  if (ec) {
    std::cerr << "[camera] cannot list " << dev_root_ << ": " << ec.message() << '\n';
    return devices;
  }

  for (const auto& entry : it) {
    const std::string node = entry.path().filename().string();
    if (node.rfind("video", 0) != 0) {
      continue;
    }

    CameraDevice device{};
    device.node = entry.path().string();

    std::ifstream name_file(std::filesystem::path(sysfs_root_) / node / "name");
    if (name_file.is_open()) {
      std::getline(name_file, device.name);
    }
    if (device.name.empty()) {
      device.name = node;
    }
    devices.push_back(std::move(device));
  }

  std::sort(devices.begin(), devices.end(),
            [](const CameraDevice& a, const CameraDevice& b) { return a.node < b.node; });
  return devices;
}

}  // namespace device_agent::providers
