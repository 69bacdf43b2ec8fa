#include "core/platform.hpp"

#include <sys/utsname.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "core/errors.hpp"

namespace device_agent::core {
namespace {

std::string to_lower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string trim(const std::string& value) {
  // device-tree strings are NUL terminated
  const auto is_blank = [](unsigned char c) { return std::isspace(c) != 0 || c == '\0'; };
  const auto begin = std::find_if_not(value.begin(), value.end(), is_blank);
  const auto end = std::find_if_not(value.rbegin(), value.rend(), is_blank).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string read_first_line(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return {};
  }
  std::string line;
  std::getline(input, line);
  return trim(line);
}

bool is_arm_machine(const std::string& machine) {
  const std::string lower = to_lower(machine);
  return lower.rfind("arm", 0) == 0 || lower.rfind("aarch64", 0) == 0;
}

bool is_known_board(const std::string& model) {
  static constexpr std::array<std::string_view, 5> kBoardKeywords = {
      "orange pi", "orangepi", "raspberry pi", "jetson", "rockchip",
  };
  const std::string lower = to_lower(model);
  return std::any_of(kBoardKeywords.begin(), kBoardKeywords.end(),
                     [&lower](std::string_view keyword) { return lower.find(keyword) != std::string::npos; });
}

// SMBIOS chassis types for desktops, laptops and mini PCs.
bool is_desktop_chassis(const std::string& chassis_type) {
  static constexpr std::array<int, 16> kDesktopChassis = {3, 4, 5, 6, 7, 8, 9, 10, 13, 14, 15, 16, 31, 32, 35, 36};
  if (chassis_type.empty()) {
    return false;
  }
  try {
    const int value = std::stoi(chassis_type);
    return std::find(kDesktopChassis.begin(), kDesktopChassis.end(), value) != kDesktopChassis.end();
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

const char* to_string(const PlatformIdentity platform) noexcept {
  switch (platform) {
    case PlatformIdentity::DESKTOP:
      return "desktop";
    case PlatformIdentity::EMBEDDED:
      return "embedded";
    case PlatformIdentity::GENERIC:
      return "generic";
  }
  return "generic";
}

std::optional<PlatformIdentity> parse_platform(std::string_view value) {
  const std::string lower = to_lower(value);
  if (lower == "desktop" || lower == "macos") {
    return PlatformIdentity::DESKTOP;
  }
  if (lower == "embedded" || lower == "orangepi") {
    return PlatformIdentity::EMBEDDED;
  }
  if (lower == "generic" || lower == "linux") {
    return PlatformIdentity::GENERIC;
  }
  return std::nullopt;
}

PlatformDetector::PlatformDetector(DetectorPaths paths) : paths_(std::move(paths)) {}

PlatformIdentity PlatformDetector::detect(const std::optional<std::string>& override_value) const {
  return detect_with_evidence(override_value).identity;
}

DetectedPlatform PlatformDetector::detect_with_evidence(const std::optional<std::string>& override_value) const {
  DetectedPlatform detected{};
  detected.overridden = override_value.has_value() && !override_value->empty();
  if (detected.overridden) {
    const auto parsed = parse_platform(*override_value);
    if (!parsed.has_value()) {
      throw ConfigError("unrecognized platform override: " + *override_value);
    }
    detected.identity = *parsed;
  }

  detected.probe = probe();
  if (!detected.overridden) {
    detected.identity = classify(detected.probe);
  }
  return detected;
}

PlatformProbe PlatformDetector::probe() const {
  PlatformProbe result{};

  utsname name{};
  if (uname(&name) == 0) {
    result.os_name = name.sysname;
    result.machine = name.machine;
  }

  result.device_tree_model = read_first_line(paths_.device_tree_model);
  result.chassis_type = read_first_line(paths_.chassis_type);

  std::error_code ec;
  result.appliance_marker = std::filesystem::exists(paths_.appliance_marker, ec);
  return result;
}

PlatformIdentity PlatformDetector::classify(const PlatformProbe& probe) {
  if (probe.os_name == "Darwin") {
    return PlatformIdentity::DESKTOP;
  }

  if (probe.os_name != "Linux") {
    return PlatformIdentity::GENERIC;
  }

  if (probe.appliance_marker) {
    return PlatformIdentity::EMBEDDED;
  }

  if (!probe.device_tree_model.empty() &&
      (is_arm_machine(probe.machine) || is_known_board(probe.device_tree_model))) {
    return PlatformIdentity::EMBEDDED;
  }

  if (is_desktop_chassis(probe.chassis_type)) {
    return PlatformIdentity::DESKTOP;
  }

  return PlatformIdentity::GENERIC;
}

}  // namespace device_agent::core
