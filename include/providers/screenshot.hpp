#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "providers/services.hpp"

namespace device_agent::providers {

struct ScreenshotResult {
  bool ok{false};
  std::string path{};
  std::uintmax_t size_bytes{0};
  std::string error{};
};

class ScreenshotProvider {
 public:
  virtual ~ScreenshotProvider() = default;

  virtual ScreenshotResult capture() = 0;
};

// Runs the configured capture command with the output path appended as the
// last argument.
class CommandScreenshotProvider final : public ScreenshotProvider {
 public:
  CommandScreenshotProvider(std::string command, std::string directory, std::chrono::milliseconds timeout,
                            CommandRunner runner = default_command_runner());

  ScreenshotResult capture() override;

 private:
  std::string command_;
  std::string directory_;
  std::chrono::milliseconds timeout_;
  CommandRunner runner_;
};

}  // namespace device_agent::providers
