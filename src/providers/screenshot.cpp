#include "providers/screenshot.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"

namespace device_agent::providers {

CommandScreenshotProvider::CommandScreenshotProvider(std::string command, std::string directory,
                                                     const std::chrono::milliseconds timeout, CommandRunner runner)
    : command_(std::move(command)), directory_(std::move(directory)), timeout_(timeout), runner_(std::move(runner)) {}

ScreenshotResult CommandScreenshotProvider::capture() {
  ScreenshotResult result{};

  std::vector<std::string> argv;
  std::istringstream words(command_);
  for (std::string word; words >> word;) {
    argv.push_back(word);
  }
  if (argv.empty()) {
    result.error = "screenshot command is empty";
    return result;
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    result.error = "cannot create " + directory_ + ": " + ec.message();
    return result;
  }

  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;
  result.path = (std::filesystem::path(directory_) / ("screenshot-" + std::to_string(timestamp_ms) + ".png")).string();
  argv.push_back(result.path);

  const core::CommandResult command = runner_(argv, timeout_);
  if (!command.ok()) {
    result.error = describe_failure(argv.front(), command);
    std::cerr << "[screenshot] " << result.error << '\n';
    return result;
  }

  result.size_bytes = std::filesystem::file_size(result.path, ec);
  if (ec) {
    result.error = "capture produced no file at " + result.path;
    return result;
  }

  result.ok = true;
  return result;
}

}  // namespace device_agent::providers
