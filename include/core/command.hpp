#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace device_agent::core {

struct CommandResult {
  bool launched{false};
  bool timed_out{false};
  int exit_code{-1};
  std::string output{};

  [[nodiscard]] bool ok() const noexcept { return launched && !timed_out && exit_code == 0; }
};

// Runs argv[0] from PATH with stdout and stderr captured. The child is killed
// when it outlives the timeout.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

}  // namespace device_agent::core
